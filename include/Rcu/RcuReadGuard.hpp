#pragma once

#include <cstdint>

#include "Rcu/RcuReclaimer.hpp"

// 作用域内的 RCU 读侧临界区
class RcuReadGuard {
public:
    RcuReadGuard(RcuReclaimer& rcu, uint32_t cpu, uint64_t now_ns) noexcept
        : rcu_(rcu), cpu_(cpu), now_ns_(now_ns), locked_(rcu.readLock(cpu, now_ns)) {}

    ~RcuReadGuard() {
        if (locked_) {
            rcu_.readUnlock(cpu_, now_ns_);
        }
    }

    RcuReadGuard(const RcuReadGuard&) = delete;
    RcuReadGuard& operator=(const RcuReadGuard&) = delete;

    bool isLocked() const noexcept { return locked_; }

private:
    RcuReclaimer& rcu_;
    uint32_t cpu_;
    uint64_t now_ns_;
    bool locked_;
};
