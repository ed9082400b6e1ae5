// Hazard/HazardPointerRegistry.hpp
#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <vector>

#include "Hazard/HazardPointerDomain.hpp"
#include "Tool/MutexLock.hpp"

struct HazardRegistryStats {
    uint64_t total_domains{0};
    uint64_t total_threads{0};
    uint64_t total_protects{0};
    uint64_t total_retires{0};
    uint64_t total_reclaims{0};
    uint64_t total_reclaimed_bytes{0};
    uint64_t pending_retired{0};
    uint64_t pending_bytes{0};
};

/**
 * @brief 多个危险指针域的集合，按 id 访问。
 *
 * 域在注册表析构前一直存活，domain() 返回的指针在此期间有效。
 */
class HazardPointerRegistry {
public:
    HazardPointerRegistry() = default;
    ~HazardPointerRegistry() = default;

    HazardPointerRegistry(const HazardPointerRegistry&) = delete;
    HazardPointerRegistry& operator=(const HazardPointerRegistry&) = delete;

    uint64_t createDomain(const HazardDomainConfig& config = HazardDomainConfig{});
    bool registerThread(uint64_t domain_id, uint64_t thread_id);

    HazardPointerDomain* domain(uint64_t domain_id) const;

    ScanResult scanDomain(uint64_t domain_id);
    ScanResult scanAllDomains();
    ScanResult totalPending() const;

    std::size_t domainCount() const;
    HazardRegistryStats stats() const;

private:
    std::vector<HazardPointerDomain*> snapshotDomains_() const;

    mutable MutexLock lock_;
    std::map<uint64_t, std::unique_ptr<HazardPointerDomain>> domains_;
    uint64_t next_domain_id_{1};
    std::atomic<uint64_t> threads_registered_{0};
};
