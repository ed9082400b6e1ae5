#include "WorkStealing/WorkStealingScheduler.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

std::size_t StealStrategy::amountFor(std::size_t victim_len, std::size_t thief_len) const noexcept {
    if (victim_len == 0) return 0;

    switch (kind) {
        case Kind::One:
            return 1;
        case Kind::Half:
            return std::max<std::size_t>(1, victim_len / 2);
        case Kind::Batch:
            return std::min(victim_len, std::max<std::size_t>(1, batch));
        case Kind::Adaptive:
            if (victim_len <= thief_len) return 0;
            return std::max<std::size_t>(1, (victim_len - thief_len) / 2);
    }
    return 0;
}


WorkStealingScheduler::WorkStealingScheduler(const SchedulerConfig& config)
    : config_(config) {}

WorkStealingScheduler::~WorkStealingScheduler() = default;

WorkStealingScheduler::Worker* WorkStealingScheduler::findWorker_(uint64_t worker_id) const {
    std::lock_guard<MutexLock> guard(registry_lock_);
    auto it = index_.find(worker_id);
    return it == index_.end() ? nullptr : it->second;
}

std::vector<WorkStealingScheduler::Worker*> WorkStealingScheduler::snapshotWorkers_() const {
    std::vector<Worker*> out;
    std::lock_guard<MutexLock> guard(registry_lock_);
    out.reserve(index_.size());
    for (const auto& w : workers_) {
        if (w->state.load(std::memory_order_acquire) != WorkerState::Shutdown) {
            out.push_back(w.get());
        }
    }
    return out;
}

bool WorkStealingScheduler::addWorker(uint64_t worker_id, uint32_t numa_node, std::size_t capacity) {
    if (capacity == 0) return false;

    std::lock_guard<MutexLock> guard(registry_lock_);
    if (index_.count(worker_id) != 0) {
        return false;
    }
    workers_.push_back(std::make_unique<Worker>(worker_id, numa_node, capacity, config_.base_backoff_ns));
    index_.emplace(worker_id, workers_.back().get());
    return true;
}

std::vector<WorkItem> WorkStealingScheduler::drainWorker_(Worker& w) {
    std::vector<WorkItem> out;
    std::lock_guard<MutexLock> guard(w.owner_lock);
    w.state.store(WorkerState::Shutdown, std::memory_order_release);
    while (auto item = w.deque.pop()) {
        out.push_back(*item);
    }
    // pop 从尾部取，按提交顺序返回
    std::reverse(out.begin(), out.end());
    drained_.fetch_add(out.size(), std::memory_order_relaxed);
    return out;
}

std::vector<WorkItem> WorkStealingScheduler::removeWorker(uint64_t worker_id) {
    Worker* w = nullptr;
    {
        std::lock_guard<MutexLock> guard(registry_lock_);
        auto it = index_.find(worker_id);
        if (it == index_.end()) return {};
        w = it->second;
        index_.erase(it);
    }
    return drainWorker_(*w);
}

std::vector<WorkItem> WorkStealingScheduler::shutdown() {
    std::vector<Worker*> all;
    {
        std::lock_guard<MutexLock> guard(registry_lock_);
        for (auto& kv : index_) all.push_back(kv.second);
        index_.clear();
    }

    std::sort(all.begin(), all.end(), [](const Worker* a, const Worker* b) { return a->id < b->id; });

    std::vector<WorkItem> out;
    for (Worker* w : all) {
        std::vector<WorkItem> part = drainWorker_(*w);
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

bool WorkStealingScheduler::pushLocked_(Worker& w, const WorkItem& item) {
    std::lock_guard<MutexLock> guard(w.owner_lock);
    WorkerState st = w.state.load(std::memory_order_acquire);
    if (st == WorkerState::Shutdown) {
        return false;
    }
    if (!w.deque.push(item)) {
        return false;
    }
    if (st != WorkerState::Active) {
        w.state.store(WorkerState::Active, std::memory_order_release);
        w.consecutive_failures.store(0, std::memory_order_relaxed);
    }
    return true;
}

bool WorkStealingScheduler::submit(uint64_t worker_id, const WorkItem& item) {
    Worker* w = findWorker_(worker_id);
    if (w == nullptr || !pushLocked_(*w, item)) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    submitted_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

std::optional<uint64_t> WorkStealingScheduler::submitBalanced(const WorkItem& item) {
    std::vector<Worker*> candidates = snapshotWorkers_();
    if (candidates.empty()) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    // 每个候选只取一次长度快照，避免排序期间长度变化破坏比较器的严格弱序
    std::vector<std::pair<std::size_t, Worker*>> ranked;
    ranked.reserve(candidates.size());
    for (Worker* w : candidates) {
        ranked.emplace_back(w->deque.size(), w);
    }

    auto by_length = [](const std::pair<std::size_t, Worker*>& a,
                        const std::pair<std::size_t, Worker*>& b) {
        if (a.first != b.first) return a.first < b.first;
        return a.second->id < b.second->id;
    };
    std::sort(ranked.begin(), ranked.end(), by_length);

    // 先尝试同 NUMA 节点，再全局最短
    if (item.hasAffinity()) {
        for (auto& r : ranked) {
            if (r.second->numa_node == item.affinity_hint && pushLocked_(*r.second, item)) {
                submitted_.fetch_add(1, std::memory_order_relaxed);
                return r.second->id;
            }
        }
    }

    for (auto& r : ranked) {
        if (pushLocked_(*r.second, item)) {
            submitted_.fetch_add(1, std::memory_order_relaxed);
            return r.second->id;
        }
    }

    rejected_.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
}

std::optional<WorkItem> WorkStealingScheduler::localPop(uint64_t worker_id) {
    Worker* w = findWorker_(worker_id);
    if (w == nullptr) return std::nullopt;

    std::lock_guard<MutexLock> guard(w->owner_lock);
    if (w->state.load(std::memory_order_acquire) == WorkerState::Shutdown) {
        return std::nullopt;
    }

    std::optional<WorkItem> item = w->deque.pop();
    if (item) {
        w->executed.fetch_add(1, std::memory_order_relaxed);
        w->state.store(WorkerState::Active, std::memory_order_release);
    } else {
        w->state.store(WorkerState::Idle, std::memory_order_release);
    }
    return item;
}

void WorkStealingScheduler::recordStealFailure_(Worker& thief) {
    thief.steal_failures.fetch_add(1, std::memory_order_relaxed);

    uint64_t backoff = thief.backoff_ns.load(std::memory_order_relaxed);
    uint64_t next = backoff == 0 ? config_.base_backoff_ns : backoff * 2;
    thief.backoff_ns.store(std::min(next, config_.max_backoff_ns), std::memory_order_relaxed);

    uint32_t failures = thief.consecutive_failures.fetch_add(1, std::memory_order_relaxed) + 1;
    WorkerState expected = WorkerState::Stealing;
    WorkerState target = (config_.sleep_after_failures != 0 && failures >= config_.sleep_after_failures)
                             ? WorkerState::Sleeping
                             : WorkerState::Idle;
    // 窃取期间若有人向该 worker 投递过任务，状态已被改回 Active，不覆盖
    thief.state.compare_exchange_strong(expected, target, std::memory_order_acq_rel);
}

std::vector<WorkItem> WorkStealingScheduler::trySteal(uint64_t thief_id, uint64_t now_ns) {
    Worker* thief = findWorker_(thief_id);
    if (thief == nullptr) return {};
    if (thief->state.load(std::memory_order_acquire) == WorkerState::Shutdown) return {};

    thief->steal_attempts.fetch_add(1, std::memory_order_relaxed);
    thief->state.store(WorkerState::Stealing, std::memory_order_release);

    struct Candidate {
        Worker* worker;
        std::size_t length;
        bool same_node;
    };

    std::vector<Candidate> candidates;
    for (Worker* w : snapshotWorkers_()) {
        if (w == thief) continue;
        std::size_t len = w->deque.size();
        if (len == 0) continue;
        candidates.push_back({w, len, w->numa_node == thief->numa_node});
    }

    if (candidates.empty()) {
        recordStealFailure_(*thief);
        return {};
    }

    // 同 NUMA 优先，其次队列长度降序
    std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        if (a.same_node != b.same_node) return a.same_node;
        if (a.length != b.length) return a.length > b.length;
        return a.worker->id < b.worker->id;
    });

    const Candidate& victim = candidates.front();
    std::size_t want = config_.strategy.amountFor(victim.length, thief->deque.size());

    std::vector<WorkItem> stolen;
    stolen.reserve(want);
    for (std::size_t i = 0; i < want; ++i) {
        std::optional<WorkItem> item = victim.worker->deque.steal();
        if (!item) break;
        stolen.push_back(*item);
    }

    if (stolen.empty()) {
        recordStealFailure_(*thief);
        return stolen;
    }

    victim.worker->stolen_from.fetch_add(stolen.size(), std::memory_order_relaxed);
    thief->stolen_to.fetch_add(stolen.size(), std::memory_order_relaxed);
    thief->backoff_ns.store(config_.base_backoff_ns, std::memory_order_relaxed);
    thief->consecutive_failures.store(0, std::memory_order_relaxed);
    thief->last_steal_ns.store(now_ns, std::memory_order_relaxed);

    WorkerState expected = WorkerState::Stealing;
    thief->state.compare_exchange_strong(expected, WorkerState::Active, std::memory_order_acq_rel);
    return stolen;
}

std::size_t WorkStealingScheduler::queueLength(uint64_t worker_id) const {
    Worker* w = findWorker_(worker_id);
    return w == nullptr ? 0 : w->deque.size();
}

std::optional<WorkerState> WorkStealingScheduler::workerState(uint64_t worker_id) const {
    Worker* w = findWorker_(worker_id);
    if (w == nullptr) return std::nullopt;
    return w->state.load(std::memory_order_acquire);
}

std::optional<WorkerStats> WorkStealingScheduler::workerStats(uint64_t worker_id) const {
    Worker* w = findWorker_(worker_id);
    if (w == nullptr) return std::nullopt;

    WorkerStats s;
    s.worker_id      = w->id;
    s.numa_node      = w->numa_node;
    s.state          = w->state.load(std::memory_order_acquire);
    s.queue_length   = w->deque.size();
    s.capacity       = w->deque.capacity();
    s.executed       = w->executed.load(std::memory_order_relaxed);
    s.stolen_from    = w->stolen_from.load(std::memory_order_relaxed);
    s.stolen_to      = w->stolen_to.load(std::memory_order_relaxed);
    s.steal_attempts = w->steal_attempts.load(std::memory_order_relaxed);
    s.steal_failures = w->steal_failures.load(std::memory_order_relaxed);
    s.backoff_ns     = w->backoff_ns.load(std::memory_order_relaxed);
    s.last_steal_ns  = w->last_steal_ns.load(std::memory_order_relaxed);
    return s;
}

SchedulerStats WorkStealingScheduler::stats() const {
    SchedulerStats s;
    std::lock_guard<MutexLock> guard(registry_lock_);
    s.workers = index_.size();
    for (const auto& w : workers_) {
        s.executed       += w->executed.load(std::memory_order_relaxed);
        s.stolen         += w->stolen_to.load(std::memory_order_relaxed);
        s.steal_attempts += w->steal_attempts.load(std::memory_order_relaxed);
        s.steal_failures += w->steal_failures.load(std::memory_order_relaxed);
        s.pending        += w->deque.size();
    }
    s.submitted = submitted_.load(std::memory_order_relaxed);
    s.rejected  = rejected_.load(std::memory_order_relaxed);
    s.drained   = drained_.load(std::memory_order_relaxed);
    return s;
}

std::size_t WorkStealingScheduler::workerCount() const {
    std::lock_guard<MutexLock> guard(registry_lock_);
    return index_.size();
}
