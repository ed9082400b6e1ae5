// tests/HazardPointerRegistry_test.cpp
#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>

#include "Hazard/HazardPointerRegistry.hpp"

namespace {

std::atomic<uint64_t> g_reclaimed{0};

void countReclaim(std::uintptr_t, std::size_t, void*) noexcept {
    g_reclaimed.fetch_add(1, std::memory_order_relaxed);
}

}  // namespace

class HazardPointerRegistryTest : public ::testing::Test {
protected:
    HazardPointerRegistry reg;
    HazardDomainConfig cfg;

    void SetUp() override {
        g_reclaimed.store(0);
        cfg.scan_threshold = 2;
        cfg.reclaimer = &countReclaim;
    }
};

TEST_F(HazardPointerRegistryTest, DomainsGetIncreasingIds) {
    EXPECT_EQ(reg.domainCount(), 0u);
    uint64_t a = reg.createDomain(cfg);
    uint64_t b = reg.createDomain(cfg);
    EXPECT_EQ(a, 1u);
    EXPECT_EQ(b, 2u);
    EXPECT_EQ(reg.domainCount(), 2u);

    ASSERT_NE(reg.domain(a), nullptr);
    EXPECT_EQ(reg.domain(a)->id(), a);
    EXPECT_EQ(reg.domain(0), nullptr);
    EXPECT_EQ(reg.domain(99), nullptr);
}

TEST_F(HazardPointerRegistryTest, RegisterThreadPerDomain) {
    uint64_t a = reg.createDomain(cfg);
    uint64_t b = reg.createDomain(cfg);

    EXPECT_TRUE(reg.registerThread(a, 1));
    EXPECT_FALSE(reg.registerThread(a, 1));
    EXPECT_TRUE(reg.registerThread(b, 1));     // 不同域互不影响
    EXPECT_FALSE(reg.registerThread(42, 1));

    EXPECT_EQ(reg.domain(a)->threadCount(), 1u);
    EXPECT_EQ(reg.stats().total_threads, 2u);
}

// 一个域里的保护不影响另一个域的回收
TEST_F(HazardPointerRegistryTest, DomainsAreIsolated) {
    uint64_t a = reg.createDomain(cfg);
    uint64_t b = reg.createDomain(cfg);
    ASSERT_TRUE(reg.registerThread(a, 1));
    ASSERT_TRUE(reg.registerThread(b, 1));

    HazardPointerDomain* da = reg.domain(a);
    HazardPointerDomain* db = reg.domain(b);

    uint64_t slot = da->acquireSlot(1).value();
    ASSERT_TRUE(da->protect(1, slot, 0x2000, 1));

    ASSERT_TRUE(db->retire(1, 0x2000, 32, 0, 1));
    ASSERT_TRUE(db->retire(1, 0x3000, 32, 0, 1));
    ASSERT_TRUE(da->retire(1, 0x2000, 32, 0, 1));

    ScanResult pending = reg.totalPending();
    EXPECT_EQ(pending.count, 3u);
    EXPECT_EQ(pending.bytes, 96u);

    ScanResult r = reg.scanDomain(b);
    EXPECT_EQ(r.count, 2u);
    EXPECT_EQ(r.bytes, 64u);
    EXPECT_EQ(g_reclaimed.load(), 2u);

    // 域 a 里只有 1 个，低于阈值，scanAllDomains 不会扫它
    r = reg.scanAllDomains();
    EXPECT_EQ(r.count, 0u);
    EXPECT_EQ(reg.totalPending().count, 1u);

    EXPECT_EQ(reg.scanDomain(77).count, 0u);
}

TEST_F(HazardPointerRegistryTest, AggregatedStats) {
    uint64_t a = reg.createDomain(cfg);
    uint64_t b = reg.createDomain(cfg);
    ASSERT_TRUE(reg.registerThread(a, 1));
    ASSERT_TRUE(reg.registerThread(b, 2));

    HazardPointerDomain* da = reg.domain(a);
    HazardPointerDomain* db = reg.domain(b);
    uint64_t s = da->acquireSlot(1).value();
    ASSERT_TRUE(da->protect(1, s, 0x10, 0));
    ASSERT_TRUE(da->retire(1, 0x20, 8, 0, 0));
    ASSERT_TRUE(da->retire(1, 0x30, 8, 0, 0));
    ASSERT_TRUE(db->retire(2, 0x40, 8, 0, 0));

    reg.scanAllDomains();

    HazardRegistryStats st = reg.stats();
    EXPECT_EQ(st.total_domains, 2u);
    EXPECT_EQ(st.total_threads, 2u);
    EXPECT_EQ(st.total_protects, 1u);
    EXPECT_EQ(st.total_retires, 3u);
    EXPECT_EQ(st.total_reclaims, 2u);
    EXPECT_EQ(st.total_reclaimed_bytes, 16u);
    EXPECT_EQ(st.pending_retired, 1u);
    EXPECT_EQ(st.pending_bytes, 8u);
}

TEST_F(HazardPointerRegistryTest, ConcurrentDomainsAndThreads) {
    const int kDomains = 4;
    std::vector<uint64_t> ids;
    for (int i = 0; i < kDomains; ++i) ids.push_back(reg.createDomain(cfg));

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            for (uint64_t id : ids) {
                ASSERT_TRUE(reg.registerThread(id, t));
                HazardPointerDomain* d = reg.domain(id);
                for (std::uintptr_t i = 1; i <= 100; ++i) {
                    d->retire(t, (static_cast<std::uintptr_t>(t) << 20) | (i << 4), 16, 0, 0);
                }
                d->scan(t);
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(reg.stats().total_threads, 16u);
    EXPECT_EQ(reg.totalPending().count, 0u);
    EXPECT_EQ(g_reclaimed.load(), 4u * 4u * 100u);
}
