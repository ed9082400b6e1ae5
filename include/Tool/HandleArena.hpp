// Tool/HandleArena.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

/**
 * @brief 带代数 (generation) 的句柄竞技场。
 *
 * 句柄布局：高 GenerationBits 位是 generation，其余低位是槽位下标（默认 32/32）。
 * erase 后 generation 自增，旧句柄随即失效，get() 返回 nullptr 而不是悬垂对象。
 * generation 到达上限的槽位不再回收进空闲链表，代数永不回绕，旧句柄永远不会复活。
 *
 * 本类不做同步，调用方用自己的锁保护。
 */
template <typename T, int GenerationBits = 32>
class HandleArena {
    static_assert(GenerationBits > 0 && GenerationBits <= 32, "generation must fit in 32 bits");

public:
    using handle_type = uint64_t;

    static constexpr handle_type kInvalidHandle = ~handle_type{0};
    static constexpr uint32_t kMaxGeneration =
        static_cast<uint32_t>((1ULL << GenerationBits) - 1);

private:
    static constexpr int kIndexBits = 64 - GenerationBits;
    static constexpr handle_type kIndexMask = (1ULL << kIndexBits) - 1;

    struct Entry {
        std::optional<T> value;
        uint32_t generation{0};
        std::size_t next_free{0};
    };

public:
    HandleArena() = default;
    ~HandleArena() = default;

    HandleArena(const HandleArena&) = delete;
    HandleArena& operator=(const HandleArena&) = delete;

    static handle_type pack(std::size_t index, uint32_t generation) noexcept;
    static std::size_t unpackIndex(handle_type handle) noexcept;
    static uint32_t unpackGeneration(handle_type handle) noexcept;

    template <class... Args>
    handle_type insert(Args&&... args);

    bool erase(handle_type handle) noexcept;

    T* get(handle_type handle) noexcept;
    const T* get(handle_type handle) const noexcept;

    bool contains(handle_type handle) const noexcept { return get(handle) != nullptr; }
    std::size_t size() const noexcept { return live_; }
    bool empty() const noexcept { return live_ == 0; }

    // 代数耗尽、永久停用的槽位数
    std::size_t retiredSlots() const noexcept { return retired_; }

    // func(handle, T&)
    template <typename Callable>
    void forEach(Callable func);

    template <typename Callable>
    void forEach(Callable func) const;

private:
    static constexpr std::size_t kNoFree = ~std::size_t{0};

    std::vector<Entry> entries_;
    std::size_t free_head_{kNoFree};
    std::size_t live_{0};
    std::size_t retired_{0};
};


template <typename T, int GenerationBits>
typename HandleArena<T, GenerationBits>::handle_type
HandleArena<T, GenerationBits>::pack(std::size_t index, uint32_t generation) noexcept {
    return (static_cast<handle_type>(generation & kMaxGeneration) << kIndexBits) |
           (static_cast<handle_type>(index) & kIndexMask);
}

template <typename T, int GenerationBits>
std::size_t HandleArena<T, GenerationBits>::unpackIndex(handle_type handle) noexcept {
    return static_cast<std::size_t>(handle & kIndexMask);
}

template <typename T, int GenerationBits>
uint32_t HandleArena<T, GenerationBits>::unpackGeneration(handle_type handle) noexcept {
    return static_cast<uint32_t>(handle >> kIndexBits);
}

template <typename T, int GenerationBits>
template <class... Args>
typename HandleArena<T, GenerationBits>::handle_type
HandleArena<T, GenerationBits>::insert(Args&&... args) {
    std::size_t index;
    if (free_head_ != kNoFree) {
        index = free_head_;
        free_head_ = entries_[index].next_free;
    } else {
        index = entries_.size();
        entries_.emplace_back();
    }

    Entry& e = entries_[index];
    e.value.emplace(std::forward<Args>(args)...);
    e.next_free = kNoFree;
    ++live_;
    return pack(index, e.generation);
}

template <typename T, int GenerationBits>
bool HandleArena<T, GenerationBits>::erase(handle_type handle) noexcept {
    if (get(handle) == nullptr) {
        return false;
    }
    std::size_t index = unpackIndex(handle);
    Entry& e = entries_[index];
    e.value.reset();
    --live_;

    if (e.generation == kMaxGeneration) {
        // 再自增就会回绕，槽位停用
        ++retired_;
        return true;
    }
    e.generation += 1;
    e.next_free = free_head_;
    free_head_ = index;
    return true;
}

template <typename T, int GenerationBits>
T* HandleArena<T, GenerationBits>::get(handle_type handle) noexcept {
    std::size_t index = unpackIndex(handle);
    if (index >= entries_.size()) return nullptr;
    Entry& e = entries_[index];
    if (!e.value || e.generation != unpackGeneration(handle)) return nullptr;
    return &*e.value;
}

template <typename T, int GenerationBits>
const T* HandleArena<T, GenerationBits>::get(handle_type handle) const noexcept {
    std::size_t index = unpackIndex(handle);
    if (index >= entries_.size()) return nullptr;
    const Entry& e = entries_[index];
    if (!e.value || e.generation != unpackGeneration(handle)) return nullptr;
    return &*e.value;
}

template <typename T, int GenerationBits>
template <typename Callable>
void HandleArena<T, GenerationBits>::forEach(Callable func) {
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        Entry& e = entries_[i];
        if (e.value) {
            func(pack(i, e.generation), *e.value);
        }
    }
}

template <typename T, int GenerationBits>
template <typename Callable>
void HandleArena<T, GenerationBits>::forEach(Callable func) const {
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        const Entry& e = entries_[i];
        if (e.value) {
            func(pack(i, e.generation), *e.value);
        }
    }
}
