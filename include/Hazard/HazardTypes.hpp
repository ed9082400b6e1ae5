// Hazard/HazardTypes.hpp
#pragma once

#include <cstddef>
#include <cstdint>

enum class HazardState : uint8_t {
    Free,
    Reserved,
    Active,
};

// 已退休、等待扫描确认无人保护的节点
struct RetiredNode {
    std::uintptr_t addr{0};
    std::size_t size_bytes{0};
    uint64_t retire_epoch{0};
    uint64_t retire_ns{0};
    uint64_t owner_thread{0};
};

struct ScanResult {
    uint64_t count{0};
    uint64_t bytes{0};

    ScanResult& operator+=(const ScanResult& other) noexcept {
        count += other.count;
        bytes += other.bytes;
        return *this;
    }
};

/**
 * @brief 回收钩子：每个被判定可回收的节点调用一次。
 *
 * 在所有域锁之外调用，不得抛异常。为空时只做记账。
 */
using HazardReclaimer = void (*)(std::uintptr_t addr, std::size_t size_bytes, void* ctx) noexcept;

struct HazardDomainConfig {
    static constexpr std::size_t kDefaultMaxSlotsPerThread = 8;
    static constexpr std::size_t kDefaultScanThreshold     = 64;

    std::size_t max_slots_per_thread{kDefaultMaxSlotsPerThread};
    std::size_t scan_threshold{kDefaultScanThreshold};
    HazardReclaimer reclaimer{nullptr};
    void* reclaimer_ctx{nullptr};
};

struct HazardThreadStats {
    uint64_t thread_id{0};
    std::size_t slots_allocated{0};
    std::size_t slots_active{0};
    uint64_t total_protects{0};
    uint64_t total_retires{0};
    uint64_t total_reclaims{0};
    uint64_t reclaimed_bytes{0};
    uint64_t scan_count{0};
    std::size_t retired_count{0};
    uint64_t retired_bytes{0};
};

struct HazardDomainStats {
    uint64_t domain_id{0};
    std::size_t threads{0};
    uint64_t total_protects{0};
    uint64_t total_retires{0};
    uint64_t total_reclaims{0};
    uint64_t reclaimed_bytes{0};
    uint64_t scans{0};
    uint64_t pending_retired{0};
    uint64_t pending_bytes{0};
    uint64_t handed_back{0};
};
