// Hazard/HazardSlot.hpp
#pragma once

#include <atomic>
#include <cstdint>

#include "Hazard/HazardTypes.hpp"

/**
 * @brief 单个危险指针槽位。
 *
 * 只有所属线程写；扫描线程并发读取 state 与 protected_addr。
 * protect 先写地址再把状态置为 Active，然后用 seq_cst 栅栏发布，
 * 与扫描端的栅栏配对，保证扫描不会漏掉一个已经完成的保护。
 */
class HazardSlot {
public:
    HazardSlot() noexcept = default;
    ~HazardSlot() = default;

    HazardSlot(const HazardSlot&) = delete;
    HazardSlot& operator=(const HazardSlot&) = delete;

    void init(uint64_t slot_id, uint64_t thread_id) noexcept;

    bool tryReserve() noexcept;
    void protect(std::uintptr_t addr, uint64_t now_ns) noexcept;
    void release() noexcept;

    bool isProtecting(std::uintptr_t addr) const noexcept;

    // 扫描端使用：Active 时返回地址，否则返回 0
    std::uintptr_t loadProtected() const noexcept;

    HazardState state() const noexcept { return state_.load(std::memory_order_acquire); }
    uint64_t slotId() const noexcept { return slot_id_; }
    uint64_t threadId() const noexcept { return thread_id_; }
    uint64_t acquireNs() const noexcept { return acquire_ns_.load(std::memory_order_relaxed); }
    uint64_t protectCount() const noexcept { return protect_count_.load(std::memory_order_relaxed); }

    uint64_t holdDuration(uint64_t now_ns) const noexcept;

private:
    uint64_t slot_id_{0};
    uint64_t thread_id_{0};

    std::atomic<HazardState> state_{HazardState::Free};
    std::atomic<std::uintptr_t> protected_addr_{0};
    std::atomic<uint64_t> acquire_ns_{0};
    std::atomic<uint64_t> protect_count_{0};
};
