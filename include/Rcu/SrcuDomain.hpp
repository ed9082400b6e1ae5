// Rcu/SrcuDomain.hpp
#pragma once

#include <atomic>
#include <cstdint>

#include "Tool/MutexLock.hpp"

/**
 * @brief 可睡眠读侧 (SRCU) 的独立读者计数域，不参与全局宽限期。
 *
 * 两个下标各有一个读者计数。startFlip 切换活跃下标后，只需等待旧下标的计数归零。
 * readLock 在自增后重新确认下标，与 flip 构成 Dekker 式配对，
 * 保证 flip 之前开始的读者不会被漏计。
 */
class SrcuDomain {
public:
    explicit SrcuDomain(uint64_t id = 0) noexcept;
    ~SrcuDomain() = default;

    SrcuDomain(const SrcuDomain&) = delete;
    SrcuDomain& operator=(const SrcuDomain&) = delete;

    unsigned readLock() noexcept;
    bool readUnlock(unsigned idx) noexcept;

    uint64_t activeReaders() const noexcept;
    uint64_t readersOn(unsigned idx) const noexcept;
    unsigned activeIndex() const noexcept;

    bool startFlip(uint64_t now_ns);
    bool tryComplete(uint64_t now_ns);

    bool flipPending() const;
    uint64_t completedFlips() const;
    uint64_t lastFlipDurationNs() const;
    uint64_t id() const noexcept { return id_; }

private:
    const uint64_t id_;

    alignas(64) std::atomic<uint64_t> counters_[2];
    alignas(64) std::atomic<unsigned> active_idx_{0};

    mutable MutexLock flip_lock_;
    bool flip_pending_{false};
    unsigned draining_idx_{0};
    uint64_t flip_start_ns_{0};
    uint64_t completed_flips_{0};
    uint64_t last_flip_ns_{0};
};
