// tests/FairLock_test.cpp
#include <gtest/gtest.h>
#include <atomic>
#include <random>
#include <thread>
#include <vector>

#include "FairLock/FairLock.hpp"

namespace {

FairLockConfig withPolicy(FairnessPolicy policy) {
    FairLockConfig cfg;
    cfg.policy = policy;
    return cfg;
}

std::vector<uint64_t> waiterThreads(const FairLock& lock) {
    std::vector<uint64_t> out;
    for (const LockWaiter& w : lock.waiters()) out.push_back(w.thread);
    return out;
}

// 最多一个写者，写者与读者不共存
bool holdersConsistent(const FairLock& lock) {
    std::size_t exclusive = 0;
    std::size_t shared = 0;
    for (const LockHolder& h : lock.holders()) {
        if (h.hold_type == HoldType::Exclusive) ++exclusive; else ++shared;
    }
    return exclusive <= 1 && !(exclusive == 1 && shared > 0);
}

}  // namespace

// ====================================================================
//                      基本规则
// ====================================================================

TEST(FairLockTest, TryAcquireRules) {
    FairLock lock(7, withPolicy(FairnessPolicy::Fifo));
    EXPECT_EQ(lock.id(), 7u);
    EXPECT_FALSE(lock.isHeld());

    EXPECT_TRUE(lock.tryAcquire(1, HoldType::Shared, 0, 10));
    EXPECT_TRUE(lock.tryAcquire(2, HoldType::Shared, 0, 10));
    EXPECT_FALSE(lock.tryAcquire(1, HoldType::Shared, 0, 10));      // 已持有
    EXPECT_FALSE(lock.tryAcquire(3, HoldType::Exclusive, 0, 10));
    EXPECT_EQ(lock.holderCount(), 2u);

    EXPECT_TRUE(lock.release(1, 20));
    EXPECT_TRUE(lock.release(2, 20));
    EXPECT_FALSE(lock.release(2, 20));

    EXPECT_TRUE(lock.tryAcquire(3, HoldType::Exclusive, 0, 30));
    EXPECT_FALSE(lock.tryAcquire(4, HoldType::Shared, 0, 30));
    EXPECT_FALSE(lock.enqueue(3, HoldType::Exclusive, 0, 30).has_value());   // 持有者不能再排队
    EXPECT_TRUE(lock.holds(3));
    EXPECT_EQ(lock.waiterState(3), WaiterState::Granted);
    EXPECT_EQ(lock.waiterState(99), std::nullopt);
}

TEST(FairLockTest, ExclusiveTryAcquireDoesNotBargePastWaiters) {
    FairLock lock(1, withPolicy(FairnessPolicy::Fifo));
    ASSERT_TRUE(lock.enqueue(1, HoldType::Exclusive, 0, 0).has_value());

    // 锁空闲但有人排队
    EXPECT_FALSE(lock.isHeld());
    EXPECT_FALSE(lock.tryAcquire(2, HoldType::Exclusive, 0, 1));
    EXPECT_EQ(lock.grantNext(2), 1u);
}

// Ticket 策略：T1..T3 依次排队，按票号放行
TEST(FairLockTest, TicketPolicyGrantsInTicketOrder) {
    FairLock lock(1, withPolicy(FairnessPolicy::Ticket));
    EXPECT_EQ(lock.enqueue(1, HoldType::Exclusive, 0, 0), 1u);
    EXPECT_EQ(lock.enqueue(2, HoldType::Exclusive, 0, 1), 2u);
    EXPECT_EQ(lock.enqueue(3, HoldType::Exclusive, 0, 2), 3u);
    EXPECT_FALSE(lock.enqueue(2, HoldType::Exclusive, 0, 3).has_value());

    EXPECT_EQ(lock.grantNext(10), 1u);
    EXPECT_EQ(lock.grantNext(11), std::nullopt);
    EXPECT_EQ(lock.waiterState(2), WaiterState::Waiting);

    ASSERT_TRUE(lock.release(1, 20));
    EXPECT_TRUE(lock.holds(2));
    EXPECT_EQ(waiterThreads(lock), (std::vector<uint64_t>{3}));

    ASSERT_TRUE(lock.release(2, 30));
    EXPECT_TRUE(lock.holds(3));

    FairLockStats st = lock.stats();
    EXPECT_EQ(st.contentions, 3u);
    EXPECT_EQ(st.grants, 3u);
    EXPECT_EQ(st.acquisitions, 3u);
    EXPECT_EQ(st.immediate_acquisitions, 0u);
    EXPECT_EQ(st.releases, 2u);
    EXPECT_EQ(st.total_hold_ns, 10u + 10u);
    EXPECT_EQ(st.max_wait_ns, 28u);     // T3: 入队 2，授予 30
}

// ====================================================================
//                      读写批次
// ====================================================================

TEST(FairLockTest, ReleaseAdmitsReaderBatchUpToWriter) {
    FairLock lock(1, withPolicy(FairnessPolicy::Fifo));
    ASSERT_TRUE(lock.tryAcquire(1, HoldType::Exclusive, 0, 0));
    ASSERT_TRUE(lock.enqueue(2, HoldType::Shared, 0, 1));
    ASSERT_TRUE(lock.enqueue(3, HoldType::Shared, 0, 2));
    ASSERT_TRUE(lock.enqueue(4, HoldType::Exclusive, 0, 3));
    ASSERT_TRUE(lock.enqueue(5, HoldType::Shared, 0, 4));

    ASSERT_TRUE(lock.release(1, 10));
    EXPECT_EQ(lock.holderCount(), 2u);
    EXPECT_TRUE(lock.holds(2));
    EXPECT_TRUE(lock.holds(3));
    EXPECT_EQ(waiterThreads(lock), (std::vector<uint64_t>{4, 5}));

    ASSERT_TRUE(lock.release(2, 20));
    EXPECT_FALSE(lock.holds(4));        // 还有读者
    ASSERT_TRUE(lock.release(3, 21));
    EXPECT_TRUE(lock.holds(4));
    EXPECT_EQ(lock.holderCount(), 1u);

    ASSERT_TRUE(lock.release(4, 30));
    EXPECT_TRUE(lock.holds(5));
    EXPECT_TRUE(holdersConsistent(lock));
}

TEST(FairLockTest, WriterPreferenceBlocksNewReaders) {
    FairLock fifo(1, withPolicy(FairnessPolicy::Fifo));
    FairLock pref(2, withPolicy(FairnessPolicy::RwWriterPref));

    for (FairLock* l : {&fifo, &pref}) {
        ASSERT_TRUE(l->tryAcquire(1, HoldType::Shared, 0, 0));
        ASSERT_TRUE(l->enqueue(2, HoldType::Exclusive, 0, 1));
    }
    EXPECT_TRUE(fifo.tryAcquire(3, HoldType::Shared, 0, 2));
    EXPECT_FALSE(pref.tryAcquire(3, HoldType::Shared, 0, 2));
}

TEST(FairLockTest, WriterPreferenceGrantsWriterFirst) {
    FairLock lock(1, withPolicy(FairnessPolicy::RwWriterPref));
    ASSERT_TRUE(lock.tryAcquire(1, HoldType::Exclusive, 0, 0));
    ASSERT_TRUE(lock.enqueue(2, HoldType::Shared, 0, 1));
    ASSERT_TRUE(lock.enqueue(3, HoldType::Shared, 0, 2));
    ASSERT_TRUE(lock.enqueue(4, HoldType::Exclusive, 0, 3));

    ASSERT_TRUE(lock.release(1, 10));
    EXPECT_TRUE(lock.holds(4));
    EXPECT_EQ(lock.holderCount(), 1u);

    ASSERT_TRUE(lock.release(4, 20));
    EXPECT_TRUE(lock.holds(2));
    EXPECT_TRUE(lock.holds(3));
}

// ====================================================================
//                      优先级老化
// ====================================================================

TEST(FairLockTest, PriorityAgingLetsOldWaiterOvertake) {
    FairLockConfig cfg = withPolicy(FairnessPolicy::PriorityAging);
    cfg.starvation_threshold_ns = 1000;   // 每 500ns 提升一级
    cfg.aging_step = 1;
    FairLock lock(1, cfg);

    ASSERT_TRUE(lock.tryAcquire(9, HoldType::Exclusive, 0, 0));
    ASSERT_TRUE(lock.enqueue(1, HoldType::Exclusive, 1, 0));
    ASSERT_TRUE(lock.enqueue(2, HoldType::Exclusive, 5, 2900));

    EXPECT_EQ(lock.ageWaiters(1000), 1u);
    EXPECT_EQ(lock.waiters()[0].effective_priority, 3u);

    // 3000：线程 1 等了 3000 -> 1+6=7；线程 2 只等了 100，不提升
    EXPECT_EQ(lock.ageWaiters(3000), 1u);
    std::vector<LockWaiter> ws = lock.waiters();
    EXPECT_EQ(ws[0].effective_priority, 7u);
    EXPECT_EQ(ws[0].base_priority, 1u);
    EXPECT_EQ(ws[1].effective_priority, 5u);

    ASSERT_TRUE(lock.release(9, 3000));
    EXPECT_TRUE(lock.holds(1));
    EXPECT_EQ(lock.stats().starvation_events, 1u);

    ASSERT_TRUE(lock.release(1, 3100));
    EXPECT_TRUE(lock.holds(2));

    FairLockStats st = lock.stats();
    EXPECT_EQ(st.aging_boosts, 2u);
    EXPECT_EQ(st.starvation_events, 1u);
    EXPECT_EQ(st.max_wait_ns, 3000u);
}

TEST(FairLockTest, PriorityTieBreaksByTicket) {
    FairLock lock(1, withPolicy(FairnessPolicy::PriorityAging));
    ASSERT_TRUE(lock.tryAcquire(9, HoldType::Exclusive, 0, 0));
    ASSERT_TRUE(lock.enqueue(1, HoldType::Exclusive, 4, 0));
    ASSERT_TRUE(lock.enqueue(2, HoldType::Exclusive, 8, 0));
    ASSERT_TRUE(lock.enqueue(3, HoldType::Exclusive, 8, 0));

    ASSERT_TRUE(lock.release(9, 1));
    EXPECT_TRUE(lock.holds(2));
    ASSERT_TRUE(lock.release(2, 2));
    EXPECT_TRUE(lock.holds(3));
}

TEST(FairLockTest, PriorityClampedToMax) {
    FairLockConfig cfg = withPolicy(FairnessPolicy::PriorityAging);
    cfg.max_priority = 10;
    cfg.starvation_threshold_ns = 100;
    cfg.aging_step = 100;
    FairLock lock(1, cfg);

    ASSERT_TRUE(lock.tryAcquire(9, HoldType::Exclusive, 0, 0));
    ASSERT_TRUE(lock.enqueue(1, HoldType::Exclusive, 1000, 0));
    ASSERT_TRUE(lock.enqueue(2, HoldType::Exclusive, 0, 0));
    EXPECT_EQ(lock.waiters()[0].base_priority, 10u);

    EXPECT_EQ(lock.ageWaiters(1000), 1u);     // 线程 1 已在上限
    EXPECT_EQ(lock.waiters()[1].effective_priority, 10u);
    EXPECT_EQ(lock.ageWaiters(5000), 0u);
}

// ====================================================================
//                      取消
// ====================================================================

TEST(FairLockTest, CancelKeepsRemainingOrder) {
    FairLock lock(1, withPolicy(FairnessPolicy::Fifo));
    ASSERT_TRUE(lock.tryAcquire(1, HoldType::Exclusive, 0, 0));
    for (uint64_t t = 2; t <= 4; ++t) ASSERT_TRUE(lock.enqueue(t, HoldType::Exclusive, 0, t));

    EXPECT_TRUE(lock.cancel(3, 5));
    EXPECT_FALSE(lock.cancel(3, 5));
    EXPECT_FALSE(lock.cancel(1, 5));      // 持有者不是等待者
    EXPECT_EQ(lock.waiterState(3), WaiterState::Cancelled);
    EXPECT_EQ(waiterThreads(lock), (std::vector<uint64_t>{2, 4}));

    ASSERT_TRUE(lock.release(1, 10));
    EXPECT_TRUE(lock.holds(2));
    ASSERT_TRUE(lock.release(2, 20));
    EXPECT_TRUE(lock.holds(4));
    EXPECT_EQ(lock.stats().cancellations, 1u);

    // 重新排队后状态不再是 Cancelled
    ASSERT_TRUE(lock.enqueue(3, HoldType::Exclusive, 0, 30));
    EXPECT_EQ(lock.waiterState(3), WaiterState::Waiting);
}

TEST(FairLockTest, CancelledHistoryIsBounded) {
    FairLock lock(1, withPolicy(FairnessPolicy::Fifo));
    ASSERT_TRUE(lock.tryAcquire(1, HoldType::Exclusive, 0, 0));

    const uint64_t kThreads = FairLock::kCancelledHistory + 44;
    for (uint64_t i = 0; i < kThreads; ++i) {
        uint64_t t = 1000 + i;
        ASSERT_TRUE(lock.enqueue(t, HoldType::Exclusive, 0, i));
        ASSERT_TRUE(lock.cancel(t, i));
    }
    EXPECT_EQ(lock.stats().cancellations, kThreads);
    EXPECT_EQ(lock.waiterCount(), 0u);

    // 最早的 44 个已被挤出历史
    for (uint64_t i = 0; i < 44; ++i) {
        EXPECT_EQ(lock.waiterState(1000 + i), std::nullopt);
    }
    for (uint64_t i = 44; i < kThreads; ++i) {
        EXPECT_EQ(lock.waiterState(1000 + i), WaiterState::Cancelled);
    }

    // 重新排队会把线程从历史里摘掉，再取消也只记一次
    uint64_t t = 1000 + kThreads - 1;
    ASSERT_TRUE(lock.enqueue(t, HoldType::Exclusive, 0, kThreads));
    EXPECT_EQ(lock.waiterState(t), WaiterState::Waiting);
    ASSERT_TRUE(lock.cancel(t, kThreads));
    EXPECT_EQ(lock.waiterState(t), WaiterState::Cancelled);
    EXPECT_EQ(lock.waiterState(1000 + 44), WaiterState::Cancelled);
}

TEST(FairLockTest, CancelDoesNotGrantImplicitly) {
    FairLock lock(1, withPolicy(FairnessPolicy::Fifo));
    ASSERT_TRUE(lock.tryAcquire(1, HoldType::Shared, 0, 0));
    ASSERT_TRUE(lock.enqueue(2, HoldType::Exclusive, 0, 1));
    ASSERT_TRUE(lock.enqueue(3, HoldType::Shared, 0, 2));

    ASSERT_TRUE(lock.cancel(2, 3));
    EXPECT_FALSE(lock.holds(3));
    EXPECT_EQ(lock.waiterCount(), 1u);

    EXPECT_EQ(lock.grantNext(4), 3u);
    EXPECT_EQ(lock.holderCount(), 2u);
}

// ====================================================================
//                      随机交错
// ====================================================================

TEST(FairLockRandomTest, HoldersStayConsistentUnderAllPolicies) {
    const FairnessPolicy policies[] = {FairnessPolicy::Fifo, FairnessPolicy::Ticket,
                                       FairnessPolicy::PriorityAging, FairnessPolicy::RwWriterPref};
    std::mt19937 rng(99);

    for (FairnessPolicy policy : policies) {
        FairLockConfig cfg = withPolicy(policy);
        cfg.starvation_threshold_ns = 1ULL << 40;
        FairLock lock(1, cfg);
        uint64_t now = 0;

        for (int step = 0; step < 5000; ++step) {
            now += rng() % 100;
            uint64_t t = rng() % 8;
            HoldType type = (rng() % 3 == 0) ? HoldType::Exclusive : HoldType::Shared;
            switch (rng() % 6) {
                case 0: lock.tryAcquire(t, type, rng() % 10, now); break;
                case 1: lock.enqueue(t, type, rng() % 10, now); break;
                case 2: lock.grantNext(now); break;
                case 3: lock.release(t, now); break;
                case 4: lock.cancel(t, now); break;
                case 5: lock.ageWaiters(now); break;
            }
            ASSERT_TRUE(holdersConsistent(lock)) << "step " << step;

            // 线程不会同时出现在持有者和等待者中
            for (const LockHolder& h : lock.holders()) {
                for (const LockWaiter& w : lock.waiters()) ASSERT_NE(h.thread, w.thread);
            }
        }

        FairLockStats st = lock.stats();
        EXPECT_EQ(st.acquisitions, st.immediate_acquisitions + st.grants);
        EXPECT_EQ(st.acquisitions, st.releases + lock.holderCount());
        EXPECT_EQ(st.contentions, st.grants + st.cancellations + lock.waiterCount());
    }
}

// ====================================================================
//                      多线程压力测试
// ====================================================================

TEST(FairLockStressTest, ConcurrentWritersAndReaders) {
    FairLock lock(1, withPolicy(FairnessPolicy::RwWriterPref));
    std::atomic<int> writers_inside{0};
    std::atomic<int> readers_inside{0};
    std::atomic<int> violations{0};
    std::atomic<uint64_t> clock{0};

    const int kThreads = 6;
    const int kRounds = 2000;
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            const uint64_t tid = static_cast<uint64_t>(i) + 1;
            const HoldType type = (i % 3 == 0) ? HoldType::Exclusive : HoldType::Shared;
            for (int r = 0; r < kRounds; ++r) {
                uint64_t now = clock.fetch_add(1);
                if (!lock.tryAcquire(tid, type, 0, now)) {
                    ASSERT_TRUE(lock.enqueue(tid, type, 0, now).has_value());
                    // 锁空闲时没有 release 来推动，由等待者自己调用 grantNext
                    while (!lock.holds(tid)) {
                        lock.grantNext(clock.fetch_add(1));
                        std::this_thread::yield();
                    }
                }

                if (type == HoldType::Exclusive) {
                    if (writers_inside.fetch_add(1) != 0 || readers_inside.load() != 0) violations.fetch_add(1);
                    writers_inside.fetch_sub(1);
                } else {
                    readers_inside.fetch_add(1);
                    if (writers_inside.load() != 0) violations.fetch_add(1);
                    readers_inside.fetch_sub(1);
                }
                ASSERT_TRUE(lock.release(tid, clock.fetch_add(1)));
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(violations.load(), 0);
    EXPECT_FALSE(lock.isHeld());
    EXPECT_EQ(lock.waiterCount(), 0u);
    EXPECT_EQ(lock.stats().releases, static_cast<uint64_t>(kThreads) * kRounds);
}
