// WorkStealing/WorkStealingScheduler.hpp
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

#include "Tool/MutexLock.hpp"
#include "WorkStealing/WorkItem.hpp"
#include "WorkStealing/WorkStealDeque.hpp"

struct SchedulerConfig {
    StealStrategy strategy{StealStrategy::half()};
    uint64_t base_backoff_ns{1000};
    uint64_t max_backoff_ns{1000000};
    uint32_t sleep_after_failures{8};   // 连续失败达到该次数后进入 Sleeping
};

/**
 * @brief 每个 worker 一个有界双端队列的工作窃取调度器。
 *
 * 所有者端 (submit / localPop) 由 worker 的 owner_lock 串行化，
 * 因为 submitBalanced 可能从任意线程向别人的队列投递；该锁在常见路径上无竞争。
 * 窃取端从不加 worker 锁，只在 top 上做 CAS。
 *
 * worker 对象在调度器析构前不会释放，removeWorker 只把它摘出索引并置为 Shutdown。
 */
class WorkStealingScheduler {
public:
    explicit WorkStealingScheduler(const SchedulerConfig& config = SchedulerConfig{});
    ~WorkStealingScheduler();

    WorkStealingScheduler(const WorkStealingScheduler&) = delete;
    WorkStealingScheduler& operator=(const WorkStealingScheduler&) = delete;
    WorkStealingScheduler(WorkStealingScheduler&&) = delete;
    WorkStealingScheduler& operator=(WorkStealingScheduler&&) = delete;

    bool addWorker(uint64_t worker_id, uint32_t numa_node, std::size_t capacity);
    std::vector<WorkItem> removeWorker(uint64_t worker_id);
    std::vector<WorkItem> shutdown();

    bool submit(uint64_t worker_id, const WorkItem& item);
    std::optional<uint64_t> submitBalanced(const WorkItem& item);

    std::optional<WorkItem> localPop(uint64_t worker_id);
    std::vector<WorkItem> trySteal(uint64_t thief_id, uint64_t now_ns);

    std::size_t queueLength(uint64_t worker_id) const;
    std::optional<WorkerState> workerState(uint64_t worker_id) const;
    std::optional<WorkerStats> workerStats(uint64_t worker_id) const;
    SchedulerStats stats() const;

    std::size_t workerCount() const;
    const SchedulerConfig& config() const noexcept { return config_; }

private:
    struct Worker {
        Worker(uint64_t worker_id, uint32_t node, std::size_t capacity, uint64_t backoff)
            : id(worker_id), numa_node(node), deque(capacity), backoff_ns(backoff) {}

        const uint64_t id;
        const uint32_t numa_node;
        WorkStealDeque<WorkItem> deque;
        MutexLock owner_lock;

        std::atomic<WorkerState> state{WorkerState::Idle};
        std::atomic<uint64_t> executed{0};
        std::atomic<uint64_t> stolen_from{0};
        std::atomic<uint64_t> stolen_to{0};
        std::atomic<uint64_t> steal_attempts{0};
        std::atomic<uint64_t> steal_failures{0};
        std::atomic<uint64_t> backoff_ns;
        std::atomic<uint64_t> last_steal_ns{0};
        std::atomic<uint32_t> consecutive_failures{0};
    };

    Worker* findWorker_(uint64_t worker_id) const;
    std::vector<Worker*> snapshotWorkers_() const;
    bool pushLocked_(Worker& w, const WorkItem& item);
    std::vector<WorkItem> drainWorker_(Worker& w);
    void recordStealFailure_(Worker& thief);

    const SchedulerConfig config_;

    mutable MutexLock registry_lock_;
    std::vector<std::unique_ptr<Worker>> workers_;          // 保持对象存活
    std::unordered_map<uint64_t, Worker*> index_;           // 仅包含未移除的 worker

    std::atomic<uint64_t> submitted_{0};
    std::atomic<uint64_t> rejected_{0};
    std::atomic<uint64_t> drained_{0};
};
