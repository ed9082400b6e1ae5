// WorkStealing/WorkStealDeque.hpp
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <type_traits>

/**
 * @brief 有界 Chase-Lev 双端队列。
 *
 * 所有者线程在尾部 (bottom) push/pop，无等待；任意线程在头部 (top) steal，无锁。
 * 两端只在剩最后一个元素时竞争，用 top 上的 CAS 决出唯一的获胜者。
 *
 * 约束：push/pop 必须由同一个所有者调用（或由调用方串行化）；T 必须平凡可拷贝，
 * 因为窃取者可能读到稍后 CAS 失败而被丢弃的槽位。
 */
template <class T>
class WorkStealDeque {
    static_assert(std::is_trivially_copyable<T>::value,
                  "WorkStealDeque requires a trivially copyable element type");

public:
    using value_type = T;
    using size_type  = std::size_t;

    explicit WorkStealDeque(size_type capacity);
    ~WorkStealDeque() = default;

    WorkStealDeque(const WorkStealDeque&) = delete;
    WorkStealDeque& operator=(const WorkStealDeque&) = delete;
    WorkStealDeque(WorkStealDeque&&) = delete;
    WorkStealDeque& operator=(WorkStealDeque&&) = delete;

    // --- 所有者端 ---
    bool push(const value_type& v) noexcept;
    std::optional<value_type> pop() noexcept;

    // --- 窃取端 ---
    std::optional<value_type> steal() noexcept;

    size_type size() const noexcept;
    bool isEmpty() const noexcept;
    size_type capacity() const noexcept { return capacity_; }

private:
    static size_type roundUpPow2_(size_type n) noexcept;

    const size_type capacity_;
    const size_type mask_;
    std::unique_ptr<value_type[]> buffer_;

    alignas(64) std::atomic<int64_t> top_{0};
    alignas(64) std::atomic<int64_t> bottom_{0};
};

#include "WorkStealDeque_impl.hpp"
