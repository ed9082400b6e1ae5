// Hazard/HazardPointerDomain.hpp
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "Hazard/HazardTypes.hpp"
#include "Hazard/ThreadHazardCtx.hpp"
#include "Tool/MutexLock.hpp"

/**
 * @brief 危险指针域：一组线程共享同一套保护/回收规则。
 *
 * scan(tid) 先摘走该线程的退休链表，再对域内 *所有* 线程的槽位取快照，
 * 只回收快照里没有出现的地址。顺序不能反：先取快照会漏掉在快照之后、退休之前完成的保护。
 *
 * 线程上下文用 shared_ptr 持有，unregisterThread 之后仍在进行的扫描不会访问悬垂对象。
 * unregisterThread 先拿上下文的扫描锁再关闭它：正在进行的扫描放回的幸存者一定会交还给调用者，
 * 关闭之后的 retire 返回 false。
 */
class HazardPointerDomain {
public:
    explicit HazardPointerDomain(uint64_t id = 0, const HazardDomainConfig& config = HazardDomainConfig{});
    ~HazardPointerDomain();

    HazardPointerDomain(const HazardPointerDomain&) = delete;
    HazardPointerDomain& operator=(const HazardPointerDomain&) = delete;

    bool registerThread(uint64_t thread_id);
    std::vector<RetiredNode> unregisterThread(uint64_t thread_id);

    std::optional<uint64_t> acquireSlot(uint64_t thread_id);
    bool protect(uint64_t thread_id, uint64_t slot_id, std::uintptr_t addr, uint64_t now_ns);
    bool releaseSlot(uint64_t thread_id, uint64_t slot_id);

    bool retire(uint64_t thread_id, std::uintptr_t addr, std::size_t size, uint64_t epoch, uint64_t now_ns);

    ScanResult scan(uint64_t thread_id);
    ScanResult scanAll();

    // 当前任意线程的 Active 槽位是否保护着 addr
    bool isProtected(std::uintptr_t addr) const;

    std::size_t retiredCount(uint64_t thread_id) const;
    uint64_t totalRetired() const;
    uint64_t totalRetiredBytes() const;
    std::size_t threadCount() const;

    std::optional<HazardThreadStats> threadStats(uint64_t thread_id) const;
    HazardDomainStats stats() const;

    uint64_t id() const noexcept { return id_; }
    const HazardDomainConfig& config() const noexcept { return config_; }

private:
    using CtxPtr = std::shared_ptr<ThreadHazardCtx>;

    CtxPtr findCtx_(uint64_t thread_id) const;
    std::vector<CtxPtr> snapshotCtxs_() const;
    std::vector<std::uintptr_t> collectProtected_() const;
    ScanResult scanCtx_(ThreadHazardCtx& ctx);
    void reclaim_(const std::vector<RetiredNode>& nodes) const noexcept;

    const uint64_t id_;
    const HazardDomainConfig config_;

    mutable MutexLock registry_lock_;
    std::map<uint64_t, CtxPtr> threads_;

    std::atomic<uint64_t> scans_{0};
    std::atomic<uint64_t> total_reclaims_{0};
    std::atomic<uint64_t> reclaimed_bytes_{0};
    std::atomic<uint64_t> handed_back_{0};
    // 已注销线程的累计计数，保证 stats() 单调
    std::atomic<uint64_t> retired_protects_{0};
    std::atomic<uint64_t> retired_retires_{0};
};
