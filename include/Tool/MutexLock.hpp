// Tool/MutexLock.hpp
#pragma once
#include <pthread.h>
#include <cstddef>
#include <cstdint>

/**
 * @brief 进程内的鲁棒互斥锁，满足 Lockable 要求，可直接配合 std::lock_guard 使用。
 *
 * FairLock / PriorityInheritanceProtocol / RCU 宽限期状态机都用它做单实例串行化。
 * Protocol::PriorityInherit 会把 pthread 协议设为 PTHREAD_PRIO_INHERIT，
 * 这样宿主线程在内部临界区上也不会发生优先级反转。
 */
class MutexLock {
public:
    enum class Protocol {
        None,
        PriorityInherit,
    };

    explicit MutexLock(Protocol protocol = Protocol::None);
    ~MutexLock();

    MutexLock(const MutexLock&) = delete;
    MutexLock& operator=(const MutexLock&) = delete;
    MutexLock(MutexLock&&) = delete;
    MutexLock& operator=(MutexLock&&) = delete;

    void lock() const;
    bool try_lock() const noexcept;
    void unlock() const noexcept;

    Protocol protocol() const noexcept { return protocol_; }

    // 上一次 lock()/try_lock() 是否从 EOWNERDEAD 中恢复
    bool recoveredFromOwnerDeath() const noexcept { return recovered_; }

private:
    alignas(64) mutable pthread_mutex_t mtx_{};
    Protocol protocol_;
    mutable bool recovered_{false};
};
