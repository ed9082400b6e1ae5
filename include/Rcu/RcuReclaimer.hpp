// Rcu/RcuReclaimer.hpp
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <vector>

#include "Rcu/CpuRcuSlot.hpp"
#include "Rcu/RcuTypes.hpp"
#include "Tool/MutexLock.hpp"

/**
 * @brief 基于宽限期的延迟回收引擎。
 *
 * 读侧 (readLock / readUnlock) 只操作调用者自己 CPU 的槽位，不加锁、不分配。
 * 宽限期状态机与回调队列由 gp_lock_ 保护。所有活跃的宽限期使用同一个完成条件：
 * 所有已注册 CPU 当前都不在读侧，因此它们总是一起完成。
 */
class RcuReclaimer {
public:
    explicit RcuReclaimer(const RcuConfig& config = RcuConfig{});
    ~RcuReclaimer();

    RcuReclaimer(const RcuReclaimer&) = delete;
    RcuReclaimer& operator=(const RcuReclaimer&) = delete;
    RcuReclaimer(RcuReclaimer&&) = delete;
    RcuReclaimer& operator=(RcuReclaimer&&) = delete;

    // CPU 注册
    bool initCpu(uint32_t cpu);
    bool offlineCpu(uint32_t cpu, uint64_t now_ns);

    // 读侧
    bool readLock(uint32_t cpu, uint64_t now_ns) noexcept;
    bool readUnlock(uint32_t cpu, uint64_t now_ns) noexcept;

    // 宽限期
    uint64_t startGracePeriod(RcuFlavor flavor, uint64_t now_ns);
    bool reportQuiescent(uint32_t cpu, uint64_t now_ns);
    bool expedite(uint64_t gp_id, uint64_t now_ns);
    std::size_t poll(uint64_t now_ns);

    std::optional<GracePeriod> gracePeriod(uint64_t gp_id) const;
    bool isCompleted(uint64_t gp_id) const;
    std::size_t activeGracePeriods() const;
    std::size_t pruneCompleted(std::size_t keep);

    // 延迟回调
    bool enqueueCallback(uint32_t cpu, const RcuCallback& cb);
    std::size_t executeCallbacks(uint32_t cpu, std::size_t max);

    // 诊断
    std::vector<uint32_t> detectStalls(uint64_t now_ns, uint64_t threshold_ns);
    std::optional<CpuRcuState> cpuState(uint32_t cpu) const;
    RcuStats stats() const;

    uint32_t maxCpus() const noexcept { return max_cpus_; }

private:
    struct PendingCallback {
        RcuCallback cb;
        uint64_t wait_for_gp;   // 入队之后开始的第一个宽限期
    };

    struct CpuCallbacks {
        std::deque<PendingCallback> queue;
        uint64_t executed{0};
    };

    CpuRcuSlot* slotFor_(uint32_t cpu) const noexcept;
    bool anyReaderActive_() const noexcept;
    std::size_t tryCompleteLocked_(uint64_t now_ns);

    const uint32_t max_cpus_;
    std::unique_ptr<CpuRcuSlot[]> slots_;
    std::atomic<uint32_t> registered_cpus_{0};

    mutable MutexLock gp_lock_;
    std::deque<GracePeriod> periods_;
    uint64_t next_gp_id_{1};
    uint64_t completed_upto_{0};
    std::vector<CpuCallbacks> callbacks_;
    RcuStats stats_{};

    std::atomic<uint64_t> stalls_detected_{0};
};
