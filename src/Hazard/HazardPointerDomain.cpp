#include "Hazard/HazardPointerDomain.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>
#include <unordered_set>
#include <utility>

HazardPointerDomain::HazardPointerDomain(uint64_t id, const HazardDomainConfig& config)
    : id_(id), config_(config) {}

HazardPointerDomain::~HazardPointerDomain() {
    // 域销毁时不会再有任何保护者，剩余节点全部交给回收钩子
    for (auto& kv : threads_) {
        reclaim_(kv.second->takeRetired());
    }
}

HazardPointerDomain::CtxPtr HazardPointerDomain::findCtx_(uint64_t thread_id) const {
    std::lock_guard<MutexLock> guard(registry_lock_);
    auto it = threads_.find(thread_id);
    return it == threads_.end() ? nullptr : it->second;
}

std::vector<HazardPointerDomain::CtxPtr> HazardPointerDomain::snapshotCtxs_() const {
    std::vector<CtxPtr> out;
    std::lock_guard<MutexLock> guard(registry_lock_);
    out.reserve(threads_.size());
    for (const auto& kv : threads_) out.push_back(kv.second);
    return out;
}

bool HazardPointerDomain::registerThread(uint64_t thread_id) {
    std::lock_guard<MutexLock> guard(registry_lock_);
    if (threads_.count(thread_id) != 0) {
        return false;
    }
    threads_.emplace(thread_id, std::make_shared<ThreadHazardCtx>(thread_id, config_.max_slots_per_thread));
    return true;
}

std::vector<RetiredNode> HazardPointerDomain::unregisterThread(uint64_t thread_id) {
    CtxPtr ctx;
    {
        std::lock_guard<MutexLock> guard(registry_lock_);
        auto it = threads_.find(thread_id);
        if (it == threads_.end()) return {};
        ctx = std::move(it->second);
        threads_.erase(it);
    }

    // 等正在进行的扫描把幸存者放回，再关闭上下文
    std::vector<RetiredNode> left;
    {
        std::lock_guard<MutexLock> scan_guard(ctx->scanLock());
        left = ctx->close();
    }

    HazardThreadStats st = ctx->stats();
    retired_protects_.fetch_add(st.total_protects, std::memory_order_relaxed);
    retired_retires_.fetch_add(st.total_retires, std::memory_order_relaxed);

    if (!left.empty()) {
        handed_back_.fetch_add(left.size(), std::memory_order_relaxed);
        std::cerr << "[HazardPointerDomain::unregisterThread] WARNING: thread " << thread_id
                  << " left " << left.size() << " retired node(s) in domain " << id_
                  << ", handing back to caller\n";
    }
    return left;
}

std::optional<uint64_t> HazardPointerDomain::acquireSlot(uint64_t thread_id) {
    CtxPtr ctx = findCtx_(thread_id);
    if (!ctx) return std::nullopt;
    return ctx->acquireSlot();
}

bool HazardPointerDomain::protect(uint64_t thread_id, uint64_t slot_id, std::uintptr_t addr, uint64_t now_ns) {
    CtxPtr ctx = findCtx_(thread_id);
    return ctx && ctx->protect(slot_id, addr, now_ns);
}

bool HazardPointerDomain::releaseSlot(uint64_t thread_id, uint64_t slot_id) {
    CtxPtr ctx = findCtx_(thread_id);
    return ctx && ctx->releaseSlot(slot_id);
}

bool HazardPointerDomain::retire(uint64_t thread_id, std::uintptr_t addr, std::size_t size,
                                 uint64_t epoch, uint64_t now_ns) {
    CtxPtr ctx = findCtx_(thread_id);
    return ctx && ctx->retire(addr, size, epoch, now_ns);
}

std::vector<std::uintptr_t> HazardPointerDomain::collectProtected_() const {
    // 与 HazardSlot::protect 中的 seq_cst 栅栏配对
    std::atomic_thread_fence(std::memory_order_seq_cst);

    std::vector<std::uintptr_t> out;
    std::lock_guard<MutexLock> guard(registry_lock_);
    for (const auto& kv : threads_) {
        kv.second->collectProtected(out);
    }
    return out;
}

void HazardPointerDomain::reclaim_(const std::vector<RetiredNode>& nodes) const noexcept {
    if (config_.reclaimer == nullptr) return;
    for (const RetiredNode& n : nodes) {
        config_.reclaimer(n.addr, n.size_bytes, config_.reclaimer_ctx);
    }
}

ScanResult HazardPointerDomain::scanCtx_(ThreadHazardCtx& ctx) {
    scans_.fetch_add(1, std::memory_order_relaxed);

    std::vector<RetiredNode> reclaimed;
    {
        // 摘走到放回之间不允许 unregisterThread 关闭上下文
        std::lock_guard<MutexLock> scan_guard(ctx.scanLock());

        std::vector<RetiredNode> batch = ctx.takeRetired();
        if (batch.empty()) {
            ctx.recordScan(0, 0);
            return {};
        }

        std::vector<std::uintptr_t> snapshot = collectProtected_();
        std::unordered_set<std::uintptr_t> hazard_set(snapshot.begin(), snapshot.end());

        std::vector<RetiredNode> survivors;
        for (RetiredNode& n : batch) {
            if (hazard_set.count(n.addr) != 0) {
                survivors.push_back(n);
            } else {
                reclaimed.push_back(n);
            }
        }
        ctx.restoreRetired(std::move(survivors));
    }

    ScanResult r;
    r.count = reclaimed.size();
    for (const RetiredNode& n : reclaimed) r.bytes += n.size_bytes;

    ctx.recordScan(r.count, r.bytes);
    total_reclaims_.fetch_add(r.count, std::memory_order_relaxed);
    reclaimed_bytes_.fetch_add(r.bytes, std::memory_order_relaxed);

    // 所有锁都已释放
    reclaim_(reclaimed);
    return r;
}

ScanResult HazardPointerDomain::scan(uint64_t thread_id) {
    CtxPtr ctx = findCtx_(thread_id);
    if (!ctx) return {};
    return scanCtx_(*ctx);
}

ScanResult HazardPointerDomain::scanAll() {
    ScanResult total;
    for (const CtxPtr& ctx : snapshotCtxs_()) {
        if (ctx->needsScan(config_.scan_threshold)) {
            total += scanCtx_(*ctx);
        }
    }
    return total;
}

bool HazardPointerDomain::isProtected(std::uintptr_t addr) const {
    std::vector<std::uintptr_t> snapshot = collectProtected_();
    return addr != 0 && std::find(snapshot.begin(), snapshot.end(), addr) != snapshot.end();
}

std::size_t HazardPointerDomain::retiredCount(uint64_t thread_id) const {
    CtxPtr ctx = findCtx_(thread_id);
    return ctx ? ctx->retiredCount() : 0;
}

uint64_t HazardPointerDomain::totalRetired() const {
    uint64_t total = 0;
    for (const CtxPtr& ctx : snapshotCtxs_()) total += ctx->retiredCount();
    return total;
}

uint64_t HazardPointerDomain::totalRetiredBytes() const {
    uint64_t total = 0;
    for (const CtxPtr& ctx : snapshotCtxs_()) total += ctx->retiredBytes();
    return total;
}

std::size_t HazardPointerDomain::threadCount() const {
    std::lock_guard<MutexLock> guard(registry_lock_);
    return threads_.size();
}

std::optional<HazardThreadStats> HazardPointerDomain::threadStats(uint64_t thread_id) const {
    CtxPtr ctx = findCtx_(thread_id);
    if (!ctx) return std::nullopt;
    return ctx->stats();
}

HazardDomainStats HazardPointerDomain::stats() const {
    HazardDomainStats s;
    s.domain_id      = id_;
    s.total_protects = retired_protects_.load(std::memory_order_relaxed);
    s.total_retires  = retired_retires_.load(std::memory_order_relaxed);

    std::vector<CtxPtr> ctxs = snapshotCtxs_();
    s.threads = ctxs.size();
    for (const CtxPtr& ctx : ctxs) {
        HazardThreadStats t = ctx->stats();
        s.total_protects  += t.total_protects;
        s.total_retires   += t.total_retires;
        s.pending_retired += t.retired_count;
        s.pending_bytes   += t.retired_bytes;
    }
    s.total_reclaims  = total_reclaims_.load(std::memory_order_relaxed);
    s.reclaimed_bytes = reclaimed_bytes_.load(std::memory_order_relaxed);
    s.scans           = scans_.load(std::memory_order_relaxed);
    s.handed_back     = handed_back_.load(std::memory_order_relaxed);
    return s;
}
