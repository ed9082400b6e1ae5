#include <gtest/gtest.h>
#include <thread>
#include <vector>

#include "Rcu/CpuRcuSlot.hpp"

// ====================================================================
//                       测试夹具 (Test Fixture)
// ====================================================================

class CpuRcuSlotTest : public ::testing::Test {
protected:
    CpuRcuSlot* slot;

    void SetUp() override {
        slot = new CpuRcuSlot();
    }

    void TearDown() override {
        delete slot;
    }
};

// ====================================================================
//                     单线程逻辑测试用例
// ====================================================================

TEST_F(CpuRcuSlotTest, InitialStateIsCorrect) {
    uint64_t state = slot->loadState();
    ASSERT_FALSE(CpuRcuSlot::isRegistered(state));
    ASSERT_FALSE(CpuRcuSlot::isInReadSide(state));
    ASSERT_EQ(CpuRcuSlot::unpackNesting(state), 0u);
    ASSERT_EQ(state, 0u);
}

TEST_F(CpuRcuSlotTest, RegisterAndUnregisterCycle) {
    ASSERT_TRUE(slot->tryRegister());
    uint64_t registered_state = slot->loadState();
    EXPECT_TRUE(CpuRcuSlot::isRegistered(registered_state));
    EXPECT_FALSE(CpuRcuSlot::isInReadSide(registered_state));

    // 重复注册失败，状态不变
    ASSERT_FALSE(slot->tryRegister());
    EXPECT_EQ(slot->loadState(), registered_state);

    EXPECT_TRUE(slot->unregister());
    EXPECT_FALSE(CpuRcuSlot::isRegistered(slot->loadState()));
    EXPECT_FALSE(slot->unregister());
}

TEST_F(CpuRcuSlotTest, NestedEnterLeave) {
    // 未注册时不能进入读侧
    EXPECT_FALSE(slot->enter(1));
    slot->tryRegister();

    EXPECT_TRUE(slot->enter(100));
    EXPECT_TRUE(slot->enter(200));
    uint64_t state = slot->loadState();
    EXPECT_TRUE(CpuRcuSlot::isInReadSide(state));
    EXPECT_EQ(CpuRcuSlot::unpackNesting(state), 2u);
    // 只记录最外层的进入时间
    EXPECT_EQ(slot->readEnterNs(), 100u);

    // 读侧中不能下线
    EXPECT_FALSE(slot->unregister());

    EXPECT_TRUE(slot->leave());
    EXPECT_TRUE(CpuRcuSlot::isInReadSide(slot->loadState()));
    EXPECT_TRUE(slot->leave());
    EXPECT_FALSE(CpuRcuSlot::isInReadSide(slot->loadState()));

    // 不配对的 leave 被忽略
    EXPECT_FALSE(slot->leave());
    EXPECT_EQ(CpuRcuSlot::unpackNesting(slot->loadState()), 0u);
}

TEST_F(CpuRcuSlotTest, QuiescentBookkeeping) {
    slot->tryRegister();
    slot->noteQuiescent(10);
    slot->noteQuiescent(25);
    EXPECT_EQ(slot->quiescentCount(), 2u);
    EXPECT_EQ(slot->lastQuiescentNs(), 25u);
}

TEST(CpuRcuSlotStaticTest, UnpackersWorkCorrectly) {
    // 嵌套=3, 已注册
    uint64_t state1 = (3ULL << 1) | 1ULL;
    EXPECT_TRUE(CpuRcuSlot::isRegistered(state1));
    EXPECT_TRUE(CpuRcuSlot::isInReadSide(state1));
    EXPECT_EQ(CpuRcuSlot::unpackNesting(state1), 3u);

    // 嵌套=0, 已注册
    uint64_t state2 = 1ULL;
    EXPECT_TRUE(CpuRcuSlot::isRegistered(state2));
    EXPECT_FALSE(CpuRcuSlot::isInReadSide(state2));
}

// ====================================================================
//                         并发测试用例
// ====================================================================

// 多个线程在同一个槽位上配对进出，最终嵌套深度必须回到 0
TEST_F(CpuRcuSlotTest, ConcurrentBalancedEnterLeave) {
    slot->tryRegister();
    const int num_threads = 8;
    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([this, i]() {
            for (int j = 0; j < 1000; ++j) {
                ASSERT_TRUE(this->slot->enter(static_cast<uint64_t>(i)));
                ASSERT_TRUE(this->slot->leave());
            }
        });
    }
    for (auto& t : threads) t.join();

    uint64_t final_state = slot->loadState();
    EXPECT_TRUE(CpuRcuSlot::isRegistered(final_state));
    EXPECT_EQ(CpuRcuSlot::unpackNesting(final_state), 0u);
}
