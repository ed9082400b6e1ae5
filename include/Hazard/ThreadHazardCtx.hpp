// Hazard/ThreadHazardCtx.hpp
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "Hazard/HazardSlot.hpp"
#include "Hazard/HazardTypes.hpp"
#include "Tool/MutexLock.hpp"

/**
 * @brief 一个线程在某个域里的上下文：固定上限的槽位数组 + 退休链表。
 *
 * 槽位数组在构造时一次分配好，扫描线程可以无锁遍历前 slotsAllocated() 个槽位。
 * 退休链表由 retired_lock_ 保护，扫描期间会整体摘走再把幸存者放回。
 * 摘走到放回之间持有 scan_lock_；close() 也先拿 scan_lock_，
 * 所以注销线程一定能拿到扫描中的幸存者。关闭之后 retire 失败。
 */
class ThreadHazardCtx {
public:
    ThreadHazardCtx(uint64_t thread_id, std::size_t max_slots);
    ~ThreadHazardCtx() = default;

    ThreadHazardCtx(const ThreadHazardCtx&) = delete;
    ThreadHazardCtx& operator=(const ThreadHazardCtx&) = delete;

    // --- 槽位 ---
    std::optional<uint64_t> acquireSlot();
    bool protect(uint64_t slot_id, std::uintptr_t addr, uint64_t now_ns) noexcept;
    bool releaseSlot(uint64_t slot_id) noexcept;
    HazardSlot* slot(uint64_t slot_id) noexcept;

    // 把 Active 槽位保护的地址追加到 out
    void collectProtected(std::vector<std::uintptr_t>& out) const;

    // --- 退休链表 ---
    bool retire(std::uintptr_t addr, std::size_t size, uint64_t epoch, uint64_t now_ns);
    std::vector<RetiredNode> takeRetired();
    void restoreRetired(std::vector<RetiredNode>&& survivors);
    std::size_t retiredCount() const;
    uint64_t retiredBytes() const;
    bool needsScan(std::size_t threshold) const;

    void recordScan(uint64_t reclaimed, uint64_t bytes) noexcept;

    // 扫描的 摘走 -> 放回 区间由调用者持有该锁
    MutexLock& scanLock() noexcept { return scan_lock_; }

    // 标记关闭并交出剩余退休节点；调用者必须已持有 scanLock()
    std::vector<RetiredNode> close();
    bool isClosed() const;

    uint64_t threadId() const noexcept { return thread_id_; }
    std::size_t maxSlots() const noexcept { return max_slots_; }
    std::size_t slotsAllocated() const noexcept { return allocated_.load(std::memory_order_acquire); }

    HazardThreadStats stats() const;

private:
    const uint64_t thread_id_;
    const std::size_t max_slots_;
    std::unique_ptr<HazardSlot[]> slots_;
    std::atomic<std::size_t> allocated_{0};

    MutexLock slot_lock_;               // 只串行化槽位分配
    MutexLock scan_lock_;
    mutable MutexLock retired_lock_;
    std::vector<RetiredNode> retired_;
    bool closed_{false};

    std::atomic<uint64_t> total_protects_{0};
    std::atomic<uint64_t> total_retires_{0};
    std::atomic<uint64_t> total_reclaims_{0};
    std::atomic<uint64_t> reclaimed_bytes_{0};
    std::atomic<uint64_t> scan_count_{0};
};
