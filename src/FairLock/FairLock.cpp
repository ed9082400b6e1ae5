#include "FairLock/FairLock.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>

FairLock::FairLock(uint64_t id, const FairLockConfig& config)
    : id_(id), config_(config) {}

bool FairLock::compatibleLocked_(HoldType type) const noexcept {
    if (type == HoldType::Exclusive) {
        return holders_.empty();
    }
    return std::none_of(holders_.begin(), holders_.end(),
                        [](const LockHolder& h) { return h.hold_type == HoldType::Exclusive; });
}

bool FairLock::knownLocked_(uint64_t thread) const noexcept {
    auto holds_it = std::find_if(holders_.begin(), holders_.end(),
                                 [thread](const LockHolder& h) { return h.thread == thread; });
    if (holds_it != holders_.end()) return true;
    return std::any_of(waiters_.begin(), waiters_.end(),
                       [thread](const LockWaiter& w) { return w.thread == thread; });
}

void FairLock::forgetCancelledLocked_(uint64_t thread) {
    cancelled_.erase(std::remove(cancelled_.begin(), cancelled_.end(), thread), cancelled_.end());
}

void FairLock::logStarvation_(const std::vector<Starved>& starved) const {
    for (const Starved& s : starved) {
        std::cerr << "[FairLock::grantNext] WARNING: lock " << id_ << " thread " << s.thread
                  << " waited " << s.waited_ns << " ns (threshold " << config_.starvation_threshold_ns
                  << " ns)\n";
    }
}

void FairLock::addHolderLocked_(uint64_t thread, HoldType type, uint64_t now_ns) {
    holders_.push_back(LockHolder{thread, type, now_ns});
    stats_.acquisitions += 1;
}

bool FairLock::tryAcquire(uint64_t thread, HoldType type, uint32_t /*priority*/, uint64_t now_ns) {
    std::lock_guard<MutexLock> guard(lock_);
    if (knownLocked_(thread)) {
        return false;
    }

    bool ok;
    if (type == HoldType::Exclusive) {
        ok = holders_.empty() && waiters_.empty();
    } else {
        ok = compatibleLocked_(HoldType::Shared);
        if (ok && config_.policy == FairnessPolicy::RwWriterPref) {
            ok = std::none_of(waiters_.begin(), waiters_.end(),
                              [](const LockWaiter& w) { return w.hold_type == HoldType::Exclusive; });
        }
    }
    if (!ok) return false;

    forgetCancelledLocked_(thread);
    addHolderLocked_(thread, type, now_ns);
    stats_.immediate_acquisitions += 1;
    return true;
}

std::optional<uint64_t> FairLock::enqueue(uint64_t thread, HoldType type, uint32_t priority, uint64_t now_ns) {
    std::lock_guard<MutexLock> guard(lock_);
    if (knownLocked_(thread)) {
        return std::nullopt;
    }

    LockWaiter w;
    w.thread             = thread;
    w.hold_type          = type;
    w.base_priority      = std::min(priority, config_.max_priority);
    w.effective_priority = w.base_priority;
    w.ticket             = next_ticket_++;
    w.enqueue_ns         = now_ns;
    waiters_.push_back(w);

    forgetCancelledLocked_(thread);
    stats_.contentions += 1;
    return w.ticket;
}

std::deque<LockWaiter>::iterator FairLock::selectLocked_() {
    switch (config_.policy) {
        case FairnessPolicy::Fifo:
        case FairnessPolicy::Ticket:
            return waiters_.begin();

        case FairnessPolicy::PriorityAging:
            // 优先级相同按 ticket，max_element 返回第一个最大值
            return std::max_element(waiters_.begin(), waiters_.end(),
                                    [](const LockWaiter& a, const LockWaiter& b) {
                                        return a.effective_priority < b.effective_priority;
                                    });

        case FairnessPolicy::RwWriterPref: {
            auto writer = std::find_if(waiters_.begin(), waiters_.end(),
                                       [](const LockWaiter& w) { return w.hold_type == HoldType::Exclusive; });
            return writer != waiters_.end() ? writer : waiters_.begin();
        }
    }
    return waiters_.begin();
}

std::optional<uint64_t> FairLock::grantNextLocked_(uint64_t now_ns, std::vector<Starved>& starved) {
    if (waiters_.empty()) return std::nullopt;

    auto it = selectLocked_();
    if (!compatibleLocked_(it->hold_type)) {
        return std::nullopt;
    }

    LockWaiter w = *it;
    waiters_.erase(it);

    uint64_t waited = w.waitedNs(now_ns);
    stats_.grants        += 1;
    stats_.total_wait_ns += waited;
    stats_.max_wait_ns    = std::max(stats_.max_wait_ns, waited);
    if (waited > config_.starvation_threshold_ns) {
        stats_.starvation_events += 1;
        starved.push_back(Starved{w.thread, waited});
    }

    addHolderLocked_(w.thread, w.hold_type, now_ns);
    return w.thread;
}

std::optional<uint64_t> FairLock::grantNext(uint64_t now_ns) {
    std::vector<Starved> starved;
    std::optional<uint64_t> granted;
    {
        std::lock_guard<MutexLock> guard(lock_);
        granted = grantNextLocked_(now_ns, starved);
    }
    // 告警在锁外输出
    logStarvation_(starved);
    return granted;
}

bool FairLock::release(uint64_t thread, uint64_t now_ns) {
    std::unique_lock<MutexLock> guard(lock_);
    auto it = std::find_if(holders_.begin(), holders_.end(),
                           [thread](const LockHolder& h) { return h.thread == thread; });
    if (it == holders_.end()) {
        return false;
    }

    uint64_t held = now_ns > it->acquire_ns ? now_ns - it->acquire_ns : 0;
    holders_.erase(it);
    stats_.releases      += 1;
    stats_.total_hold_ns += held;
    stats_.max_hold_ns    = std::max(stats_.max_hold_ns, held);

    // 一次释放可能放行一批读者
    std::vector<Starved> starved;
    while (grantNextLocked_(now_ns, starved)) {
    }
    guard.unlock();

    logStarvation_(starved);
    return true;
}

bool FairLock::cancel(uint64_t thread, uint64_t /*now_ns*/) {
    std::lock_guard<MutexLock> guard(lock_);
    auto it = std::find_if(waiters_.begin(), waiters_.end(),
                           [thread](const LockWaiter& w) { return w.thread == thread; });
    if (it == waiters_.end()) {
        return false;
    }
    // deque::erase 保持其余等待者的相对顺序
    waiters_.erase(it);
    cancelled_.push_back(thread);
    if (cancelled_.size() > kCancelledHistory) {
        cancelled_.pop_front();
    }
    stats_.cancellations += 1;
    return true;
}

std::size_t FairLock::ageWaiters(uint64_t now_ns) {
    std::lock_guard<MutexLock> guard(lock_);
    uint64_t half = config_.starvation_threshold_ns / 2;
    if (half == 0) return 0;

    std::size_t aged = 0;
    for (LockWaiter& w : waiters_) {
        uint64_t waited = w.waitedNs(now_ns);
        if (waited <= half) continue;

        uint64_t boost  = static_cast<uint64_t>(config_.aging_step) * (waited / half);
        uint64_t target = std::min<uint64_t>(config_.max_priority, w.base_priority + boost);
        if (target > w.effective_priority) {
            w.effective_priority = static_cast<uint32_t>(target);
            ++aged;
        }
    }
    stats_.aging_boosts += aged;
    return aged;
}

bool FairLock::isHeld() const {
    std::lock_guard<MutexLock> guard(lock_);
    return !holders_.empty();
}

bool FairLock::holds(uint64_t thread) const {
    std::lock_guard<MutexLock> guard(lock_);
    return std::any_of(holders_.begin(), holders_.end(),
                       [thread](const LockHolder& h) { return h.thread == thread; });
}

std::optional<WaiterState> FairLock::waiterState(uint64_t thread) const {
    std::lock_guard<MutexLock> guard(lock_);
    if (std::any_of(waiters_.begin(), waiters_.end(),
                    [thread](const LockWaiter& w) { return w.thread == thread; })) {
        return WaiterState::Waiting;
    }
    if (std::any_of(holders_.begin(), holders_.end(),
                    [thread](const LockHolder& h) { return h.thread == thread; })) {
        return WaiterState::Granted;
    }
    if (std::find(cancelled_.begin(), cancelled_.end(), thread) != cancelled_.end()) {
        return WaiterState::Cancelled;
    }
    return std::nullopt;
}

std::size_t FairLock::holderCount() const {
    std::lock_guard<MutexLock> guard(lock_);
    return holders_.size();
}

std::size_t FairLock::waiterCount() const {
    std::lock_guard<MutexLock> guard(lock_);
    return waiters_.size();
}

std::vector<LockHolder> FairLock::holders() const {
    std::lock_guard<MutexLock> guard(lock_);
    return holders_;
}

std::vector<LockWaiter> FairLock::waiters() const {
    std::lock_guard<MutexLock> guard(lock_);
    return std::vector<LockWaiter>(waiters_.begin(), waiters_.end());
}

FairLockStats FairLock::stats() const {
    std::lock_guard<MutexLock> guard(lock_);
    return stats_;
}
