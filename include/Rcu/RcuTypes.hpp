// Rcu/RcuTypes.hpp
#pragma once

#include <cstddef>
#include <cstdint>

enum class RcuFlavor : uint8_t {
    Preempt,
    Bh,
    Sched,
    Srcu,
    Tasks,
    Polled,
};

enum class GracePeriodState : uint8_t {
    Idle,
    Started,
    WaitingForReaders,
    Completed,
    ForcedExpedited,
};

struct GracePeriod {
    uint64_t id{0};
    RcuFlavor flavor{RcuFlavor::Preempt};
    GracePeriodState state{GracePeriodState::Idle};
    uint64_t start_ns{0};
    uint64_t end_ns{0};
    bool expedited{false};

    bool isCompleted() const noexcept { return state == GracePeriodState::Completed; }
    uint64_t durationNs() const noexcept {
        return isCompleted() && end_ns > start_ns ? end_ns - start_ns : 0;
    }
};

/**
 * @brief 延迟回调：宽限期结束后才允许执行。
 *
 * func 可以为空，此时只做计数（纯记账）。func 在引擎锁之外调用，不得抛异常。
 */
struct RcuCallback {
    using Func = void (*)(void* ctx) noexcept;

    Func func{nullptr};
    void* ctx{nullptr};
    std::size_t bytes{0};
};

// 某个 CPU 的只读快照
struct CpuRcuState {
    uint32_t cpu{0};
    bool in_read_side{false};
    uint32_t nesting_depth{0};
    uint64_t read_enter_ns{0};
    uint64_t quiescent_count{0};
    uint64_t last_quiescent_ns{0};
    uint64_t callbacks_pending{0};
    uint64_t callbacks_executed{0};
};

struct RcuStats {
    uint32_t registered_cpus{0};
    uint64_t gps_started{0};
    uint64_t gps_completed{0};
    uint64_t gps_expedited{0};
    uint64_t total_gp_ns{0};
    uint64_t max_gp_ns{0};
    uint64_t quiescent_reports{0};
    uint64_t callbacks_enqueued{0};
    uint64_t callbacks_executed{0};
    uint64_t callback_bytes_freed{0};
    uint64_t stalls_detected{0};
};

struct RcuConfig {
    uint32_t max_cpus{256};
};
