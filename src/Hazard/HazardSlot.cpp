#include "Hazard/HazardSlot.hpp"

void HazardSlot::init(uint64_t slot_id, uint64_t thread_id) noexcept {
    slot_id_   = slot_id;
    thread_id_ = thread_id;
}

bool HazardSlot::tryReserve() noexcept {
    HazardState expected = HazardState::Free;
    return state_.compare_exchange_strong(expected, HazardState::Reserved,
                                          std::memory_order_acq_rel,
                                          std::memory_order_relaxed);
}

void HazardSlot::protect(std::uintptr_t addr, uint64_t now_ns) noexcept {
    protected_addr_.store(addr, std::memory_order_release);
    acquire_ns_.store(now_ns, std::memory_order_relaxed);
    state_.store(HazardState::Active, std::memory_order_release);
    protect_count_.fetch_add(1, std::memory_order_relaxed);

    // store-load 屏障：之后对 addr 的解引用不能排到发布之前
    std::atomic_thread_fence(std::memory_order_seq_cst);
}

void HazardSlot::release() noexcept {
    state_.store(HazardState::Free, std::memory_order_release);
    protected_addr_.store(0, std::memory_order_release);
}

bool HazardSlot::isProtecting(std::uintptr_t addr) const noexcept {
    return addr != 0 && loadProtected() == addr;
}

std::uintptr_t HazardSlot::loadProtected() const noexcept {
    if (state_.load(std::memory_order_acquire) != HazardState::Active) {
        return 0;
    }
    return protected_addr_.load(std::memory_order_acquire);
}

uint64_t HazardSlot::holdDuration(uint64_t now_ns) const noexcept {
    if (state_.load(std::memory_order_acquire) != HazardState::Active) {
        return 0;
    }
    uint64_t since = acquire_ns_.load(std::memory_order_relaxed);
    return now_ns > since ? now_ns - since : 0;
}
