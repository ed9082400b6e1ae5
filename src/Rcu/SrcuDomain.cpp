#include "Rcu/SrcuDomain.hpp"

#include <mutex>

SrcuDomain::SrcuDomain(uint64_t id) noexcept
    : id_(id) {
    counters_[0].store(0, std::memory_order_relaxed);
    counters_[1].store(0, std::memory_order_relaxed);
}

unsigned SrcuDomain::readLock() noexcept {
    for (;;) {
        unsigned idx = active_idx_.load(std::memory_order_seq_cst);
        counters_[idx].fetch_add(1, std::memory_order_seq_cst);
        if (active_idx_.load(std::memory_order_seq_cst) == idx) {
            return idx;
        }
        // 期间发生了 flip，撤销后在新下标上重试
        counters_[idx].fetch_sub(1, std::memory_order_seq_cst);
    }
}

bool SrcuDomain::readUnlock(unsigned idx) noexcept {
    if (idx > 1) return false;
    uint64_t cur = counters_[idx].load(std::memory_order_relaxed);
    for (;;) {
        if (cur == 0) return false;
        if (counters_[idx].compare_exchange_weak(cur, cur - 1,
                                                 std::memory_order_release,
                                                 std::memory_order_relaxed)) {
            return true;
        }
    }
}

uint64_t SrcuDomain::activeReaders() const noexcept {
    return counters_[0].load(std::memory_order_acquire) +
           counters_[1].load(std::memory_order_acquire);
}

uint64_t SrcuDomain::readersOn(unsigned idx) const noexcept {
    return idx > 1 ? 0 : counters_[idx].load(std::memory_order_acquire);
}

unsigned SrcuDomain::activeIndex() const noexcept {
    return active_idx_.load(std::memory_order_acquire);
}

bool SrcuDomain::startFlip(uint64_t now_ns) {
    std::lock_guard<MutexLock> guard(flip_lock_);
    if (flip_pending_) {
        return false;
    }
    unsigned old_idx = active_idx_.load(std::memory_order_relaxed);
    active_idx_.store(old_idx ^ 1u, std::memory_order_seq_cst);
    draining_idx_  = old_idx;
    flip_pending_  = true;
    flip_start_ns_ = now_ns;
    return true;
}

bool SrcuDomain::tryComplete(uint64_t now_ns) {
    std::lock_guard<MutexLock> guard(flip_lock_);
    if (!flip_pending_) {
        return false;
    }
    if (counters_[draining_idx_].load(std::memory_order_seq_cst) != 0) {
        return false;
    }
    flip_pending_ = false;
    completed_flips_ += 1;
    last_flip_ns_ = now_ns > flip_start_ns_ ? now_ns - flip_start_ns_ : 0;
    return true;
}

bool SrcuDomain::flipPending() const {
    std::lock_guard<MutexLock> guard(flip_lock_);
    return flip_pending_;
}

uint64_t SrcuDomain::completedFlips() const {
    std::lock_guard<MutexLock> guard(flip_lock_);
    return completed_flips_;
}

uint64_t SrcuDomain::lastFlipDurationNs() const {
    std::lock_guard<MutexLock> guard(flip_lock_);
    return last_flip_ns_;
}
