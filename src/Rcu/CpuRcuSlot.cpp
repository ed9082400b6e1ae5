#include "Rcu/CpuRcuSlot.hpp"

CpuRcuSlot::CpuRcuSlot() noexcept {
    state_.store(pack_(0, false), std::memory_order_relaxed);
}

bool CpuRcuSlot::tryRegister() noexcept {
    uint64_t old_state = state_.load(std::memory_order_relaxed);
    for (;;) {
        if (isRegistered(old_state)) {
            return false;
        }
        if (state_.compare_exchange_weak(old_state, pack_(0, true),
                                         std::memory_order_release,
                                         std::memory_order_relaxed)) {
            return true;
        }
    }
}

bool CpuRcuSlot::unregister() noexcept {
    uint64_t old_state = state_.load(std::memory_order_relaxed);
    for (;;) {
        // 读侧中的 CPU 不能下线
        if (!isRegistered(old_state) || isInReadSide(old_state)) {
            return false;
        }
        if (state_.compare_exchange_weak(old_state, pack_(0, false),
                                         std::memory_order_release,
                                         std::memory_order_relaxed)) {
            return true;
        }
    }
}

bool CpuRcuSlot::enter(uint64_t now_ns) noexcept {
    uint64_t old_state = state_.load(std::memory_order_relaxed);
    for (;;) {
        if (!isRegistered(old_state)) {
            return false;
        }
        uint32_t nesting = unpackNesting(old_state);
        if (nesting == 0) {
            // 只在最外层记录进入时间，供停顿检测使用
            read_enter_ns_.store(now_ns, std::memory_order_relaxed);
        }
        uint64_t new_state = pack_(nesting + 1, true);
        // seq_cst：进入读侧的写不能排到随后读取受保护数据之后，与宽限期检查的栅栏配对
        if (state_.compare_exchange_weak(old_state, new_state,
                                         std::memory_order_seq_cst,
                                         std::memory_order_relaxed)) {
            return true;
        }
    }
}

bool CpuRcuSlot::leave() noexcept {
    uint64_t old_state = state_.load(std::memory_order_relaxed);
    for (;;) {
        uint32_t nesting = unpackNesting(old_state);
        if (!isRegistered(old_state) || nesting == 0) {
            return false;   // 不配对的 unlock 直接忽略
        }
        uint64_t new_state = pack_(nesting - 1, true);
        if (state_.compare_exchange_weak(old_state, new_state,
                                         std::memory_order_release,
                                         std::memory_order_relaxed)) {
            return true;
        }
    }
}

void CpuRcuSlot::noteQuiescent(uint64_t now_ns) noexcept {
    quiescent_count_.fetch_add(1, std::memory_order_relaxed);
    last_quiescent_ns_.store(now_ns, std::memory_order_relaxed);
}

uint64_t CpuRcuSlot::loadState() const noexcept {
    return state_.load(std::memory_order_acquire);
}

uint64_t CpuRcuSlot::readEnterNs() const noexcept {
    return read_enter_ns_.load(std::memory_order_relaxed);
}

uint64_t CpuRcuSlot::quiescentCount() const noexcept {
    return quiescent_count_.load(std::memory_order_relaxed);
}

uint64_t CpuRcuSlot::lastQuiescentNs() const noexcept {
    return last_quiescent_ns_.load(std::memory_order_relaxed);
}

// --- 静态辅助函数实现 ---
bool CpuRcuSlot::isRegistered(uint64_t state) noexcept {
    return (state & kRegisteredBit) != 0;
}

bool CpuRcuSlot::isInReadSide(uint64_t state) noexcept {
    return unpackNesting(state) != 0;
}

uint32_t CpuRcuSlot::unpackNesting(uint64_t state) noexcept {
    return static_cast<uint32_t>(state >> kNestingShift);
}

uint64_t CpuRcuSlot::pack_(uint32_t nesting, bool registered) noexcept {
    uint64_t state = static_cast<uint64_t>(nesting) << kNestingShift;
    if (registered) state |= kRegisteredBit;
    return state;
}
