#include "Hazard/ThreadHazardCtx.hpp"

#include <iterator>
#include <mutex>
#include <utility>

ThreadHazardCtx::ThreadHazardCtx(uint64_t thread_id, std::size_t max_slots)
    : thread_id_(thread_id),
      max_slots_(max_slots),
      slots_(new HazardSlot[max_slots == 0 ? 1 : max_slots]) {
    for (std::size_t i = 0; i < max_slots_; ++i) {
        slots_[i].init(i, thread_id_);
    }
}

std::optional<uint64_t> ThreadHazardCtx::acquireSlot() {
    std::lock_guard<MutexLock> guard(slot_lock_);

    std::size_t n = allocated_.load(std::memory_order_relaxed);
    for (std::size_t i = 0; i < n; ++i) {
        if (slots_[i].tryReserve()) {
            return static_cast<uint64_t>(i);
        }
    }

    if (n < max_slots_ && slots_[n].tryReserve()) {
        // 先把槽位置为 Reserved 再公开给扫描端
        allocated_.store(n + 1, std::memory_order_release);
        return static_cast<uint64_t>(n);
    }
    return std::nullopt;
}

HazardSlot* ThreadHazardCtx::slot(uint64_t slot_id) noexcept {
    if (slot_id >= allocated_.load(std::memory_order_acquire)) return nullptr;
    return &slots_[slot_id];
}

bool ThreadHazardCtx::protect(uint64_t slot_id, std::uintptr_t addr, uint64_t now_ns) noexcept {
    HazardSlot* s = slot(slot_id);
    if (s == nullptr || s->state() == HazardState::Free) {
        return false;
    }
    s->protect(addr, now_ns);
    total_protects_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

bool ThreadHazardCtx::releaseSlot(uint64_t slot_id) noexcept {
    HazardSlot* s = slot(slot_id);
    if (s == nullptr || s->state() == HazardState::Free) {
        return false;
    }
    s->release();
    return true;
}

void ThreadHazardCtx::collectProtected(std::vector<std::uintptr_t>& out) const {
    std::size_t n = allocated_.load(std::memory_order_acquire);
    for (std::size_t i = 0; i < n; ++i) {
        std::uintptr_t addr = slots_[i].loadProtected();
        if (addr != 0) {
            out.push_back(addr);
        }
    }
}

bool ThreadHazardCtx::retire(std::uintptr_t addr, std::size_t size, uint64_t epoch, uint64_t now_ns) {
    RetiredNode node;
    node.addr         = addr;
    node.size_bytes   = size;
    node.retire_epoch = epoch;
    node.retire_ns    = now_ns;
    node.owner_thread = thread_id_;

    std::lock_guard<MutexLock> guard(retired_lock_);
    if (closed_) {
        return false;
    }
    retired_.push_back(node);
    total_retires_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

std::vector<RetiredNode> ThreadHazardCtx::takeRetired() {
    std::lock_guard<MutexLock> guard(retired_lock_);
    return std::exchange(retired_, {});
}

void ThreadHazardCtx::restoreRetired(std::vector<RetiredNode>&& survivors) {
    if (survivors.empty()) return;

    std::lock_guard<MutexLock> guard(retired_lock_);
    // 幸存者更早退休，放回队首，扫描期间新退休的节点排在后面
    survivors.insert(survivors.end(),
                     std::make_move_iterator(retired_.begin()),
                     std::make_move_iterator(retired_.end()));
    retired_ = std::move(survivors);
}

std::vector<RetiredNode> ThreadHazardCtx::close() {
    std::lock_guard<MutexLock> guard(retired_lock_);
    closed_ = true;
    return std::exchange(retired_, {});
}

bool ThreadHazardCtx::isClosed() const {
    std::lock_guard<MutexLock> guard(retired_lock_);
    return closed_;
}

std::size_t ThreadHazardCtx::retiredCount() const {
    std::lock_guard<MutexLock> guard(retired_lock_);
    return retired_.size();
}

uint64_t ThreadHazardCtx::retiredBytes() const {
    std::lock_guard<MutexLock> guard(retired_lock_);
    uint64_t bytes = 0;
    for (const RetiredNode& n : retired_) bytes += n.size_bytes;
    return bytes;
}

bool ThreadHazardCtx::needsScan(std::size_t threshold) const {
    return retiredCount() >= threshold;
}

void ThreadHazardCtx::recordScan(uint64_t reclaimed, uint64_t bytes) noexcept {
    scan_count_.fetch_add(1, std::memory_order_relaxed);
    total_reclaims_.fetch_add(reclaimed, std::memory_order_relaxed);
    reclaimed_bytes_.fetch_add(bytes, std::memory_order_relaxed);
}

HazardThreadStats ThreadHazardCtx::stats() const {
    HazardThreadStats s;
    s.thread_id       = thread_id_;
    s.slots_allocated = allocated_.load(std::memory_order_acquire);
    for (std::size_t i = 0; i < s.slots_allocated; ++i) {
        if (slots_[i].state() == HazardState::Active) ++s.slots_active;
    }
    s.total_protects  = total_protects_.load(std::memory_order_relaxed);
    s.total_retires   = total_retires_.load(std::memory_order_relaxed);
    s.total_reclaims  = total_reclaims_.load(std::memory_order_relaxed);
    s.reclaimed_bytes = reclaimed_bytes_.load(std::memory_order_relaxed);
    s.scan_count      = scan_count_.load(std::memory_order_relaxed);
    {
        std::lock_guard<MutexLock> guard(retired_lock_);
        s.retired_count = retired_.size();
        for (const RetiredNode& n : retired_) s.retired_bytes += n.size_bytes;
    }
    return s;
}
