// tests/WorkStealDeque_test.cpp
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <thread>
#include <vector>

#include "WorkStealing/WorkStealDeque.hpp"

// ====================================================================
//                     单线程逻辑测试用例
// ====================================================================

TEST(WorkStealDequeTest, EmptyDequeBehaviour) {
    WorkStealDeque<int> dq(8);
    EXPECT_TRUE(dq.isEmpty());
    EXPECT_EQ(dq.size(), 0u);
    EXPECT_FALSE(dq.pop().has_value());
    EXPECT_FALSE(dq.steal().has_value());

    // 空 pop 之后 bottom 必须恢复，后续 push 仍然可见
    ASSERT_TRUE(dq.push(1));
    EXPECT_EQ(dq.size(), 1u);
}

TEST(WorkStealDequeTest, OwnerPopIsLifo_StealIsFifo) {
    WorkStealDeque<int> dq(8);
    for (int i = 1; i <= 4; ++i) ASSERT_TRUE(dq.push(i));

    EXPECT_EQ(dq.pop().value(), 4);     // 尾部
    EXPECT_EQ(dq.steal().value(), 1);   // 头部
    EXPECT_EQ(dq.steal().value(), 2);
    EXPECT_EQ(dq.pop().value(), 3);
    EXPECT_TRUE(dq.isEmpty());
}

TEST(WorkStealDequeTest, PushFailsWhenFull) {
    WorkStealDeque<int> dq(3);      // 环形缓冲是 4，但逻辑容量是 3
    EXPECT_EQ(dq.capacity(), 3u);
    EXPECT_TRUE(dq.push(1));
    EXPECT_TRUE(dq.push(2));
    EXPECT_TRUE(dq.push(3));
    EXPECT_FALSE(dq.push(4));
    EXPECT_EQ(dq.size(), 3u);

    // 头部腾出一个位置后又可以 push
    EXPECT_EQ(dq.steal().value(), 1);
    EXPECT_TRUE(dq.push(4));
    EXPECT_EQ(dq.size(), 3u);
}

TEST(WorkStealDequeTest, WrapsAroundRingBuffer) {
    WorkStealDeque<int> dq(4);
    int next = 0;
    int expect_head = 0;
    for (int round = 0; round < 50; ++round) {
        while (dq.push(next)) ++next;
        EXPECT_EQ(dq.steal().value(), expect_head++);
        EXPECT_EQ(dq.steal().value(), expect_head++);
    }
}

TEST(WorkStealDequeTest, SingleElementGoesToExactlyOneSide) {
    WorkStealDeque<int> dq(2);
    ASSERT_TRUE(dq.push(7));
    EXPECT_EQ(dq.pop().value(), 7);
    EXPECT_FALSE(dq.steal().has_value());

    ASSERT_TRUE(dq.push(8));
    EXPECT_EQ(dq.steal().value(), 8);
    EXPECT_FALSE(dq.pop().has_value());
}

// ====================================================================
//                     多线程压力测试
// ====================================================================

// 所有者 push/pop，多个窃取者 steal：每个元素恰好被取走一次
TEST(WorkStealDequeTest, ConcurrentOwnerAndThieves_NoLossNoDuplicate) {
    const int kItems = 200000;
    const int kThieves = 4;
    WorkStealDeque<int> dq(256);

    std::vector<std::atomic<int>> taken(kItems);
    for (auto& t : taken) t.store(0);

    std::atomic<bool> done{false};
    std::vector<std::thread> thieves;
    for (int i = 0; i < kThieves; ++i) {
        thieves.emplace_back([&] {
            while (!done.load(std::memory_order_acquire) || !dq.isEmpty()) {
                if (auto v = dq.steal()) {
                    taken[*v].fetch_add(1, std::memory_order_relaxed);
                }
            }
        });
    }

    int pushed = 0;
    while (pushed < kItems) {
        if (dq.push(pushed)) {
            ++pushed;
        } else if (auto v = dq.pop()) {
            taken[*v].fetch_add(1, std::memory_order_relaxed);
        }
        if ((pushed & 7) == 0) {
            if (auto v = dq.pop()) taken[*v].fetch_add(1, std::memory_order_relaxed);
        }
    }
    while (auto v = dq.pop()) {
        taken[*v].fetch_add(1, std::memory_order_relaxed);
    }
    done.store(true, std::memory_order_release);
    for (auto& t : thieves) t.join();

    for (int i = 0; i < kItems; ++i) {
        ASSERT_EQ(taken[i].load(), 1) << "item " << i;
    }
}
