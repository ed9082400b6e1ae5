// WorkStealing/WorkItem.hpp
#pragma once

#include <cstddef>
#include <cstdint>

// 工作项本身是平凡可拷贝的描述符，真正的任务负载由调用方通过 id 关联。
struct WorkItem {
    static constexpr uint32_t kNoAffinity = ~uint32_t{0};

    uint64_t id{0};
    uint32_t priority{0};
    uint32_t affinity_hint{kNoAffinity};   // 期望的 NUMA 节点
    uint64_t estimated_cost{1};
    uint64_t created_ns{0};

    bool hasAffinity() const noexcept { return affinity_hint != kNoAffinity; }
};

enum class WorkerState : uint8_t {
    Active,
    Idle,
    Stealing,
    Sleeping,
    Shutdown,
};

// 封闭集合的窃取策略：kind 为标签，batch 仅在 Batch 下有意义
struct StealStrategy {
    enum class Kind : uint8_t {
        One,
        Half,
        Batch,
        Adaptive,
    };

    Kind kind{Kind::Half};
    std::size_t batch{0};

    static StealStrategy one() noexcept { return {Kind::One, 0}; }
    static StealStrategy half() noexcept { return {Kind::Half, 0}; }
    static StealStrategy batchOf(std::size_t n) noexcept { return {Kind::Batch, n}; }
    static StealStrategy adaptive() noexcept { return {Kind::Adaptive, 0}; }

    // 给定受害者与窃取者的队列长度，计算本次打算窃取的数量
    std::size_t amountFor(std::size_t victim_len, std::size_t thief_len) const noexcept;
};

struct WorkerStats {
    uint64_t worker_id{0};
    uint32_t numa_node{0};
    WorkerState state{WorkerState::Idle};
    std::size_t queue_length{0};
    std::size_t capacity{0};
    uint64_t executed{0};
    uint64_t stolen_from{0};      // 被别人偷走的数量
    uint64_t stolen_to{0};        // 从别人那里偷来的数量
    uint64_t steal_attempts{0};
    uint64_t steal_failures{0};
    uint64_t backoff_ns{0};
    uint64_t last_steal_ns{0};
};

struct SchedulerStats {
    std::size_t workers{0};
    uint64_t submitted{0};
    uint64_t executed{0};
    uint64_t stolen{0};
    uint64_t steal_attempts{0};
    uint64_t steal_failures{0};
    uint64_t rejected{0};
    uint64_t drained{0};
    std::size_t pending{0};
};
