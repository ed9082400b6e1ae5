// FairLock/FairLockTypes.hpp
#pragma once

#include <cstdint>

enum class FairnessPolicy : uint8_t {
    Fifo,
    Ticket,
    PriorityAging,
    RwWriterPref,
};

enum class HoldType : uint8_t {
    Exclusive,
    Shared,
};

enum class WaiterState : uint8_t {
    Waiting,
    Granted,
    Cancelled,
};

struct LockHolder {
    uint64_t thread{0};
    HoldType hold_type{HoldType::Exclusive};
    uint64_t acquire_ns{0};
};

struct LockWaiter {
    uint64_t thread{0};
    HoldType hold_type{HoldType::Exclusive};
    uint32_t base_priority{0};
    uint32_t effective_priority{0};
    uint64_t ticket{0};
    uint64_t enqueue_ns{0};

    uint64_t waitedNs(uint64_t now_ns) const noexcept {
        return now_ns > enqueue_ns ? now_ns - enqueue_ns : 0;
    }
};

struct FairLockConfig {
    static constexpr uint64_t kDefaultStarvationThresholdNs = 100ULL * 1000 * 1000;   // 100ms
    static constexpr uint32_t kDefaultMaxPriority           = 255;

    FairnessPolicy policy{FairnessPolicy::Fifo};
    uint64_t starvation_threshold_ns{kDefaultStarvationThresholdNs};
    uint32_t aging_step{1};
    uint32_t max_priority{kDefaultMaxPriority};
};

struct FairLockStats {
    uint64_t acquisitions{0};           // 立即获取 + 排队后授予
    uint64_t immediate_acquisitions{0};
    uint64_t contentions{0};            // enqueue 次数
    uint64_t grants{0};
    uint64_t releases{0};
    uint64_t cancellations{0};
    uint64_t starvation_events{0};
    uint64_t aging_boosts{0};
    uint64_t total_wait_ns{0};
    uint64_t max_wait_ns{0};
    uint64_t total_hold_ns{0};
    uint64_t max_hold_ns{0};

    FairLockStats& operator+=(const FairLockStats& o) noexcept {
        acquisitions           += o.acquisitions;
        immediate_acquisitions += o.immediate_acquisitions;
        contentions            += o.contentions;
        grants                 += o.grants;
        releases               += o.releases;
        cancellations          += o.cancellations;
        starvation_events      += o.starvation_events;
        aging_boosts           += o.aging_boosts;
        total_wait_ns          += o.total_wait_ns;
        total_hold_ns          += o.total_hold_ns;
        if (o.max_wait_ns > max_wait_ns) max_wait_ns = o.max_wait_ns;
        if (o.max_hold_ns > max_hold_ns) max_hold_ns = o.max_hold_ns;
        return *this;
    }
};
