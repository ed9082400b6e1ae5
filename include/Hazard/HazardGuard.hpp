// Hazard/HazardGuard.hpp
#pragma once

#include <cstdint>
#include <optional>

#include "Hazard/HazardPointerDomain.hpp"

/**
 * @brief 作用域内占用一个槽位，析构时释放。
 *
 * 典型用法：protect(p) 之后必须重新读取源指针确认 p 仍然可达，才能解引用。
 */
class HazardGuard {
public:
    HazardGuard(HazardPointerDomain& domain, uint64_t thread_id)
        : domain_(domain), thread_id_(thread_id), slot_(domain.acquireSlot(thread_id)) {}

    ~HazardGuard() { reset(); }

    HazardGuard(const HazardGuard&) = delete;
    HazardGuard& operator=(const HazardGuard&) = delete;

    bool valid() const noexcept { return slot_.has_value(); }
    std::optional<uint64_t> slotId() const noexcept { return slot_; }

    bool protect(std::uintptr_t addr, uint64_t now_ns) {
        return slot_ && domain_.protect(thread_id_, *slot_, addr, now_ns);
    }

    template <typename T>
    bool protect(const T* ptr, uint64_t now_ns) {
        return protect(reinterpret_cast<std::uintptr_t>(ptr), now_ns);
    }

    void reset() {
        if (slot_) {
            domain_.releaseSlot(thread_id_, *slot_);
            slot_.reset();
        }
    }

private:
    HazardPointerDomain& domain_;
    uint64_t thread_id_;
    std::optional<uint64_t> slot_;
};
