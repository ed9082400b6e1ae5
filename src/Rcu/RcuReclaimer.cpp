#include "Rcu/RcuReclaimer.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>

RcuReclaimer::RcuReclaimer(const RcuConfig& config)
    : max_cpus_(config.max_cpus == 0 ? 1 : config.max_cpus),
      slots_(new CpuRcuSlot[max_cpus_]),
      callbacks_(max_cpus_) {}

RcuReclaimer::~RcuReclaimer() = default;

CpuRcuSlot* RcuReclaimer::slotFor_(uint32_t cpu) const noexcept {
    if (cpu >= max_cpus_) return nullptr;
    return &slots_[cpu];
}

bool RcuReclaimer::initCpu(uint32_t cpu) {
    CpuRcuSlot* slot = slotFor_(cpu);
    if (slot == nullptr || !slot->tryRegister()) {
        return false;
    }
    registered_cpus_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

bool RcuReclaimer::offlineCpu(uint32_t cpu, uint64_t now_ns) {
    CpuRcuSlot* slot = slotFor_(cpu);
    if (slot == nullptr || !slot->unregister()) {
        return false;
    }
    registered_cpus_.fetch_sub(1, std::memory_order_relaxed);

    // 下线的 CPU 不再阻塞宽限期
    std::lock_guard<MutexLock> guard(gp_lock_);
    tryCompleteLocked_(now_ns);
    return true;
}

bool RcuReclaimer::readLock(uint32_t cpu, uint64_t now_ns) noexcept {
    CpuRcuSlot* slot = slotFor_(cpu);
    return slot != nullptr && slot->enter(now_ns);
}

bool RcuReclaimer::readUnlock(uint32_t cpu, uint64_t /*now_ns*/) noexcept {
    CpuRcuSlot* slot = slotFor_(cpu);
    return slot != nullptr && slot->leave();
}

bool RcuReclaimer::anyReaderActive_() const noexcept {
    // 与读侧 leave 的 release 配对
    std::atomic_thread_fence(std::memory_order_seq_cst);
    for (uint32_t cpu = 0; cpu < max_cpus_; ++cpu) {
        uint64_t state = slots_[cpu].loadState();
        if (CpuRcuSlot::isRegistered(state) && CpuRcuSlot::isInReadSide(state)) {
            return true;
        }
    }
    return false;
}

std::size_t RcuReclaimer::tryCompleteLocked_(uint64_t now_ns) {
    bool has_active = false;
    for (const GracePeriod& gp : periods_) {
        if (!gp.isCompleted()) {
            has_active = true;
            break;
        }
    }
    if (!has_active) return 0;

    if (anyReaderActive_()) {
        for (GracePeriod& gp : periods_) {
            if (gp.state == GracePeriodState::Started) {
                gp.state = GracePeriodState::WaitingForReaders;
            }
        }
        return 0;
    }

    std::size_t completed = 0;
    for (GracePeriod& gp : periods_) {
        if (gp.isCompleted()) continue;
        gp.state  = GracePeriodState::Completed;
        gp.end_ns = std::max(now_ns, gp.start_ns);
        completed_upto_ = std::max(completed_upto_, gp.id);

        uint64_t duration = gp.durationNs();
        stats_.gps_completed += 1;
        stats_.total_gp_ns   += duration;
        stats_.max_gp_ns      = std::max(stats_.max_gp_ns, duration);
        ++completed;
    }
    return completed;
}

uint64_t RcuReclaimer::startGracePeriod(RcuFlavor flavor, uint64_t now_ns) {
    std::lock_guard<MutexLock> guard(gp_lock_);
    GracePeriod gp;
    gp.id       = next_gp_id_++;
    gp.flavor   = flavor;
    gp.state    = GracePeriodState::Started;
    gp.start_ns = now_ns;
    periods_.push_back(gp);
    stats_.gps_started += 1;
    return gp.id;
}

bool RcuReclaimer::reportQuiescent(uint32_t cpu, uint64_t now_ns) {
    CpuRcuSlot* slot = slotFor_(cpu);
    if (slot == nullptr) return false;

    uint64_t state = slot->loadState();
    if (!CpuRcuSlot::isRegistered(state) || CpuRcuSlot::isInReadSide(state)) {
        return false;   // 还在读侧，不算静止态
    }
    slot->noteQuiescent(now_ns);

    std::lock_guard<MutexLock> guard(gp_lock_);
    stats_.quiescent_reports += 1;
    tryCompleteLocked_(now_ns);
    return true;
}

bool RcuReclaimer::expedite(uint64_t gp_id, uint64_t now_ns) {
    std::lock_guard<MutexLock> guard(gp_lock_);
    auto it = std::find_if(periods_.begin(), periods_.end(),
                           [gp_id](const GracePeriod& gp) { return gp.id == gp_id; });
    if (it == periods_.end() || it->isCompleted()) {
        return false;
    }
    if (!it->expedited) {
        it->expedited = true;
        stats_.gps_expedited += 1;
    }
    it->state = GracePeriodState::ForcedExpedited;
    // 加急只是立即重新检查，仍然必须等读者全部退出
    tryCompleteLocked_(now_ns);
    return true;
}

std::size_t RcuReclaimer::poll(uint64_t now_ns) {
    std::lock_guard<MutexLock> guard(gp_lock_);
    return tryCompleteLocked_(now_ns);
}

std::optional<GracePeriod> RcuReclaimer::gracePeriod(uint64_t gp_id) const {
    std::lock_guard<MutexLock> guard(gp_lock_);
    for (const GracePeriod& gp : periods_) {
        if (gp.id == gp_id) return gp;
    }
    return std::nullopt;
}

bool RcuReclaimer::isCompleted(uint64_t gp_id) const {
    std::lock_guard<MutexLock> guard(gp_lock_);
    // 活跃宽限期总是一起完成，所以 id 不超过 completed_upto_ 的都已完成（包括已被 prune 的）
    return gp_id != 0 && gp_id <= completed_upto_;
}

std::size_t RcuReclaimer::activeGracePeriods() const {
    std::lock_guard<MutexLock> guard(gp_lock_);
    return static_cast<std::size_t>(std::count_if(periods_.begin(), periods_.end(),
                                                  [](const GracePeriod& gp) { return !gp.isCompleted(); }));
}

std::size_t RcuReclaimer::pruneCompleted(std::size_t keep) {
    std::lock_guard<MutexLock> guard(gp_lock_);
    std::size_t completed = static_cast<std::size_t>(std::count_if(
        periods_.begin(), periods_.end(), [](const GracePeriod& gp) { return gp.isCompleted(); }));
    if (completed <= keep) return 0;

    std::size_t to_remove = completed - keep;
    std::size_t removed = 0;
    for (auto it = periods_.begin(); it != periods_.end() && removed < to_remove;) {
        if (it->isCompleted()) {
            it = periods_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

bool RcuReclaimer::enqueueCallback(uint32_t cpu, const RcuCallback& cb) {
    CpuRcuSlot* slot = slotFor_(cpu);
    if (slot == nullptr || !CpuRcuSlot::isRegistered(slot->loadState())) {
        return false;
    }

    std::lock_guard<MutexLock> guard(gp_lock_);
    callbacks_[cpu].queue.push_back(PendingCallback{cb, next_gp_id_});
    stats_.callbacks_enqueued += 1;
    return true;
}

std::size_t RcuReclaimer::executeCallbacks(uint32_t cpu, std::size_t max) {
    if (cpu >= max_cpus_ || max == 0) return 0;

    std::vector<RcuCallback> ready;
    {
        std::lock_guard<MutexLock> guard(gp_lock_);
        CpuCallbacks& cbs = callbacks_[cpu];
        // wait_for_gp 在队列中单调不减，遇到第一个未就绪的即可停止
        while (!cbs.queue.empty() && ready.size() < max &&
               cbs.queue.front().wait_for_gp <= completed_upto_) {
            ready.push_back(cbs.queue.front().cb);
            cbs.queue.pop_front();
        }
        cbs.executed += ready.size();
        stats_.callbacks_executed += ready.size();
        for (const RcuCallback& cb : ready) {
            stats_.callback_bytes_freed += cb.bytes;
        }
    }

    // 在锁外执行负载，回调里可以再次调用本引擎
    for (const RcuCallback& cb : ready) {
        if (cb.func != nullptr) {
            cb.func(cb.ctx);
        }
    }
    return ready.size();
}

std::vector<uint32_t> RcuReclaimer::detectStalls(uint64_t now_ns, uint64_t threshold_ns) {
    std::vector<uint32_t> stalled;
    for (uint32_t cpu = 0; cpu < max_cpus_; ++cpu) {
        const CpuRcuSlot& slot = slots_[cpu];
        uint64_t state = slot.loadState();
        if (!CpuRcuSlot::isRegistered(state) || !CpuRcuSlot::isInReadSide(state)) {
            continue;
        }
        uint64_t entered = slot.readEnterNs();
        if (now_ns > entered && now_ns - entered > threshold_ns) {
            stalled.push_back(cpu);
        }
    }

    if (!stalled.empty()) {
        stalls_detected_.fetch_add(stalled.size(), std::memory_order_relaxed);
        std::cerr << "[RcuReclaimer::detectStalls] WARNING: " << stalled.size()
                  << " CPU(s) in read-side longer than " << threshold_ns << " ns, first cpu="
                  << stalled.front() << "\n";
    }
    return stalled;
}

std::optional<CpuRcuState> RcuReclaimer::cpuState(uint32_t cpu) const {
    CpuRcuSlot* slot = slotFor_(cpu);
    if (slot == nullptr) return std::nullopt;

    uint64_t state = slot->loadState();
    if (!CpuRcuSlot::isRegistered(state)) return std::nullopt;

    CpuRcuState s;
    s.cpu               = cpu;
    s.in_read_side      = CpuRcuSlot::isInReadSide(state);
    s.nesting_depth     = CpuRcuSlot::unpackNesting(state);
    s.read_enter_ns     = s.in_read_side ? slot->readEnterNs() : 0;
    s.quiescent_count   = slot->quiescentCount();
    s.last_quiescent_ns = slot->lastQuiescentNs();
    {
        std::lock_guard<MutexLock> guard(gp_lock_);
        s.callbacks_pending  = callbacks_[cpu].queue.size();
        s.callbacks_executed = callbacks_[cpu].executed;
    }
    return s;
}

RcuStats RcuReclaimer::stats() const {
    RcuStats s;
    {
        std::lock_guard<MutexLock> guard(gp_lock_);
        s = stats_;
    }
    s.registered_cpus = registered_cpus_.load(std::memory_order_relaxed);
    s.stalls_detected = stalls_detected_.load(std::memory_order_relaxed);
    return s;
}
