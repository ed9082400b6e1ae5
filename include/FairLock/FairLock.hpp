// FairLock/FairLock.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

#include "FairLock/FairLockTypes.hpp"
#include "Tool/MutexLock.hpp"

/**
 * @brief 可插拔公平策略的读写锁状态机。
 *
 * 本类不阻塞线程：排不上的调用者拿到 ticket 后在外部等待，
 * 由 grantNext / release 把它提升为持有者。所有操作由内部 MutexLock 串行化。
 *
 * 不变式：最多一个 Exclusive 持有者，且 Exclusive 与 Shared 不会同时持有。
 */
class FairLock {
public:
    // waiterState 只记住最近这么多个取消的线程
    static constexpr std::size_t kCancelledHistory = 256;

    explicit FairLock(uint64_t id = 0, const FairLockConfig& config = FairLockConfig{});
    ~FairLock() = default;

    FairLock(const FairLock&) = delete;
    FairLock& operator=(const FairLock&) = delete;

    bool tryAcquire(uint64_t thread, HoldType type, uint32_t priority, uint64_t now_ns);
    std::optional<uint64_t> enqueue(uint64_t thread, HoldType type, uint32_t priority, uint64_t now_ns);

    std::optional<uint64_t> grantNext(uint64_t now_ns);
    bool release(uint64_t thread, uint64_t now_ns);
    bool cancel(uint64_t thread, uint64_t now_ns);

    std::size_t ageWaiters(uint64_t now_ns);

    bool isHeld() const;
    bool holds(uint64_t thread) const;
    std::optional<WaiterState> waiterState(uint64_t thread) const;
    std::size_t holderCount() const;
    std::size_t waiterCount() const;
    std::vector<LockHolder> holders() const;
    std::vector<LockWaiter> waiters() const;
    FairLockStats stats() const;

    uint64_t id() const noexcept { return id_; }
    const FairLockConfig& config() const noexcept { return config_; }

private:
    struct Starved {
        uint64_t thread;
        uint64_t waited_ns;
    };

    bool compatibleLocked_(HoldType type) const noexcept;
    bool knownLocked_(uint64_t thread) const noexcept;
    std::deque<LockWaiter>::iterator selectLocked_();
    std::optional<uint64_t> grantNextLocked_(uint64_t now_ns, std::vector<Starved>& starved);
    void addHolderLocked_(uint64_t thread, HoldType type, uint64_t now_ns);
    void forgetCancelledLocked_(uint64_t thread);
    void logStarvation_(const std::vector<Starved>& starved) const;

    const uint64_t id_;
    const FairLockConfig config_;

    mutable MutexLock lock_;
    std::vector<LockHolder> holders_;
    std::deque<LockWaiter> waiters_;        // 按 ticket 递增
    std::deque<uint64_t> cancelled_;       // 最早取消的在队首
    uint64_t next_ticket_{1};
    FairLockStats stats_{};
};
