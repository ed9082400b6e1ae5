#include "Hazard/HazardPointerRegistry.hpp"

#include <mutex>

uint64_t HazardPointerRegistry::createDomain(const HazardDomainConfig& config) {
    std::lock_guard<MutexLock> guard(lock_);
    uint64_t id = next_domain_id_++;
    domains_.emplace(id, std::make_unique<HazardPointerDomain>(id, config));
    return id;
}

HazardPointerDomain* HazardPointerRegistry::domain(uint64_t domain_id) const {
    std::lock_guard<MutexLock> guard(lock_);
    auto it = domains_.find(domain_id);
    return it == domains_.end() ? nullptr : it->second.get();
}

std::vector<HazardPointerDomain*> HazardPointerRegistry::snapshotDomains_() const {
    std::vector<HazardPointerDomain*> out;
    std::lock_guard<MutexLock> guard(lock_);
    for (const auto& kv : domains_) out.push_back(kv.second.get());
    return out;
}

bool HazardPointerRegistry::registerThread(uint64_t domain_id, uint64_t thread_id) {
    HazardPointerDomain* d = domain(domain_id);
    if (d == nullptr || !d->registerThread(thread_id)) {
        return false;
    }
    threads_registered_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

ScanResult HazardPointerRegistry::scanDomain(uint64_t domain_id) {
    HazardPointerDomain* d = domain(domain_id);
    return d == nullptr ? ScanResult{} : d->scanAll();
}

ScanResult HazardPointerRegistry::scanAllDomains() {
    ScanResult total;
    for (HazardPointerDomain* d : snapshotDomains_()) {
        total += d->scanAll();
    }
    return total;
}

ScanResult HazardPointerRegistry::totalPending() const {
    ScanResult total;
    for (HazardPointerDomain* d : snapshotDomains_()) {
        total.count += d->totalRetired();
        total.bytes += d->totalRetiredBytes();
    }
    return total;
}

std::size_t HazardPointerRegistry::domainCount() const {
    std::lock_guard<MutexLock> guard(lock_);
    return domains_.size();
}

HazardRegistryStats HazardPointerRegistry::stats() const {
    HazardRegistryStats s;
    std::vector<HazardPointerDomain*> ds = snapshotDomains_();
    s.total_domains = ds.size();
    s.total_threads = threads_registered_.load(std::memory_order_relaxed);
    for (HazardPointerDomain* d : ds) {
        HazardDomainStats ds_stats = d->stats();
        s.total_protects        += ds_stats.total_protects;
        s.total_retires         += ds_stats.total_retires;
        s.total_reclaims        += ds_stats.total_reclaims;
        s.total_reclaimed_bytes += ds_stats.reclaimed_bytes;
        s.pending_retired       += ds_stats.pending_retired;
        s.pending_bytes         += ds_stats.pending_bytes;
    }
    return s;
}
