#include "PriorityInherit/PriorityInheritanceProtocol.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>

PriorityInheritanceProtocol::PriorityInheritanceProtocol(PiProtocol protocol)
    : protocol_(protocol) {}

void PriorityInheritanceProtocol::recomputeEffective_(TaskPriorityState& t) noexcept {
    uint32_t eff = t.base_priority;
    for (const PiBoost& b : t.boosts) {
        eff = std::max(eff, b.priority);
    }
    t.effective_priority = eff;
}

PiHandle PriorityInheritanceProtocol::registerResource(uint32_t ceiling) {
    std::lock_guard<MutexLock> guard(lock_);
    PiResource r;
    r.ceiling = ceiling;
    return resources_.insert(std::move(r));
}

bool PriorityInheritanceProtocol::unregisterResource(PiHandle resource) {
    std::lock_guard<MutexLock> guard(lock_);
    const PiResource* r = resources_.get(resource);
    if (r == nullptr || r->held || !r->waiters.empty()) {
        return false;
    }
    return resources_.erase(resource);
}

PiHandle PriorityInheritanceProtocol::registerTask(uint32_t base_priority) {
    std::lock_guard<MutexLock> guard(lock_);
    TaskPriorityState t;
    t.base_priority      = base_priority;
    t.effective_priority = base_priority;
    return tasks_.insert(std::move(t));
}

bool PriorityInheritanceProtocol::unregisterTask(PiHandle task) {
    std::lock_guard<MutexLock> guard(lock_);
    const TaskPriorityState* t = tasks_.get(task);
    if (t == nullptr || t->blocked || !t->held.empty()) {
        return false;
    }
    return tasks_.erase(task);
}

void PriorityInheritanceProtocol::grantLocked_(PiHandle task, PiHandle resource, uint64_t now_ns) {
    TaskPriorityState* t = tasks_.get(task);
    PiResource* r = resources_.get(resource);

    r->held       = true;
    r->holder     = task;
    r->acquire_ns = now_ns;
    t->held.push_back(resource);
    stats_.acquisitions += 1;

    if (protocol_ == PiProtocol::ImmediateCeiling && r->ceiling > t->base_priority) {
        t->boosts.push_back(PiBoost{resource, r->ceiling, true});
        recomputeEffective_(*t);
        stats_.ceiling_boosts += 1;
    }
}

void PriorityInheritanceProtocol::logDepthLimit_(PiHandle start_resource) {
    std::cerr << "[PriorityInheritanceProtocol::propagateBoost] WARNING: wait-for chain from resource "
              << start_resource << " exceeds " << kMaxChainDepth << " hops, truncated\n";
}

bool PriorityInheritanceProtocol::propagateBoost_(PiHandle start_resource) {
    const uint32_t limit = protocol_ == PiProtocol::DirectInheritance ? 1 : kMaxChainDepth;

    PiHandle res_h = start_resource;
    uint32_t depth = 0;
    for (;;) {
        PiResource* r = resources_.get(res_h);
        if (r == nullptr || !r->held) break;

        if (depth >= limit) {
            if (protocol_ == PiProtocol::DirectInheritance) {
                return false;
            }
            stats_.depth_limit_hits += 1;
            return true;
        }

        TaskPriorityState* h = tasks_.get(r->holder);
        if (h == nullptr) break;

        uint32_t top = 0;
        for (PiHandle w : r->waiters) {
            const TaskPriorityState* wt = tasks_.get(w);
            if (wt != nullptr) top = std::max(top, wt->effective_priority);
        }

        // 重算持有者在该资源上的继承提升，天花板提升保留
        uint32_t before = h->effective_priority;
        h->boosts.erase(std::remove_if(h->boosts.begin(), h->boosts.end(),
                                       [res_h](const PiBoost& b) {
                                           return b.resource == res_h && !b.from_ceiling;
                                       }),
                        h->boosts.end());
        if (top > h->base_priority) {
            h->boosts.push_back(PiBoost{res_h, top, false});
        }
        recomputeEffective_(*h);

        ++depth;
        stats_.max_chain_depth = std::max(stats_.max_chain_depth, depth);
        if (h->effective_priority > before) {
            stats_.boosts_applied += 1;
        }

        // 持有者优先级没变，更上游不受影响
        if (h->effective_priority == before || !h->blocked) break;
        res_h = h->blocked_on;
    }
    return false;
}

PiAcquireResult PriorityInheritanceProtocol::acquire(PiHandle task, PiHandle resource, uint64_t now_ns) {
    std::unique_lock<MutexLock> guard(lock_);
    TaskPriorityState* t = tasks_.get(task);
    PiResource* r = resources_.get(resource);
    if (t == nullptr || r == nullptr) {
        return PiAcquireResult::Invalid;
    }
    if (r->held && r->holder == task) {
        return PiAcquireResult::AlreadyHeld;
    }
    if (t->blocked) {
        return PiAcquireResult::Invalid;
    }

    if (!r->held) {
        grantLocked_(task, resource, now_ns);
        return PiAcquireResult::Acquired;
    }

    r->waiters.push_back(task);
    t->blocked          = true;
    t->blocked_on       = resource;
    t->blocked_since_ns = now_ns;
    stats_.contended += 1;

    bool truncated = propagateBoost_(resource);
    guard.unlock();

    if (truncated) logDepthLimit_(resource);
    return PiAcquireResult::Blocked;
}

std::optional<PiHandle> PriorityInheritanceProtocol::release(PiHandle task, PiHandle resource, uint64_t now_ns) {
    std::unique_lock<MutexLock> guard(lock_);
    TaskPriorityState* t = tasks_.get(task);
    PiResource* r = resources_.get(resource);
    if (t == nullptr || r == nullptr || !r->held || r->holder != task) {
        return std::nullopt;
    }

    r->held   = false;
    r->holder = 0;
    t->held.erase(std::remove(t->held.begin(), t->held.end(), resource), t->held.end());
    t->boosts.erase(std::remove_if(t->boosts.begin(), t->boosts.end(),
                                   [resource](const PiBoost& b) { return b.resource == resource; }),
                    t->boosts.end());
    recomputeEffective_(*t);
    stats_.releases += 1;

    // 释放者自己也可能阻塞在别的资源上，它降级后上游要跟着重算
    std::vector<PiHandle> truncated;
    if (t->blocked && propagateBoost_(t->blocked_on)) {
        truncated.push_back(t->blocked_on);
    }

    if (r->waiters.empty()) {
        guard.unlock();
        for (PiHandle h : truncated) logDepthLimit_(h);
        return std::nullopt;
    }

    // 最高有效优先级的等待者，同优先级先到先得
    auto best = r->waiters.begin();
    uint32_t best_prio = 0;
    for (auto it = r->waiters.begin(); it != r->waiters.end(); ++it) {
        const TaskPriorityState* wt = tasks_.get(*it);
        uint32_t p = wt != nullptr ? wt->effective_priority : 0;
        if (it == r->waiters.begin() || p > best_prio) {
            best = it;
            best_prio = p;
        }
    }
    PiHandle next = *best;
    r->waiters.erase(best);

    TaskPriorityState* nt = tasks_.get(next);
    nt->blocked    = false;
    nt->blocked_on = 0;
    grantLocked_(next, resource, now_ns);
    stats_.handoffs += 1;

    // 剩余等待者转而提升新的持有者
    if (propagateBoost_(resource)) {
        truncated.push_back(resource);
    }
    guard.unlock();

    for (PiHandle h : truncated) logDepthLimit_(h);
    return next;
}

bool PriorityInheritanceProtocol::cancelWait(PiHandle task, uint64_t /*now_ns*/) {
    std::unique_lock<MutexLock> guard(lock_);
    TaskPriorityState* t = tasks_.get(task);
    if (t == nullptr || !t->blocked) {
        return false;
    }

    PiHandle resource = t->blocked_on;
    PiResource* r = resources_.get(resource);
    if (r != nullptr) {
        r->waiters.erase(std::remove(r->waiters.begin(), r->waiters.end(), task), r->waiters.end());
    }
    t->blocked    = false;
    t->blocked_on = 0;
    stats_.cancellations += 1;

    // 撤销这个等待者带来的提升
    bool truncated = propagateBoost_(resource);
    guard.unlock();

    if (truncated) logDepthLimit_(resource);
    return true;
}

std::optional<uint32_t> PriorityInheritanceProtocol::effectivePriority(PiHandle task) const {
    std::lock_guard<MutexLock> guard(lock_);
    const TaskPriorityState* t = tasks_.get(task);
    if (t == nullptr) return std::nullopt;
    return t->effective_priority;
}

std::optional<uint32_t> PriorityInheritanceProtocol::basePriority(PiHandle task) const {
    std::lock_guard<MutexLock> guard(lock_);
    const TaskPriorityState* t = tasks_.get(task);
    if (t == nullptr) return std::nullopt;
    return t->base_priority;
}

bool PriorityInheritanceProtocol::setBasePriority(PiHandle task, uint32_t priority) {
    std::unique_lock<MutexLock> guard(lock_);
    TaskPriorityState* t = tasks_.get(task);
    if (t == nullptr) {
        return false;
    }
    t->base_priority = priority;
    recomputeEffective_(*t);

    PiHandle from = t->blocked_on;
    bool truncated = t->blocked && propagateBoost_(from);
    guard.unlock();

    if (truncated) logDepthLimit_(from);
    return true;
}

std::optional<PiHandle> PriorityInheritanceProtocol::holder(PiHandle resource) const {
    std::lock_guard<MutexLock> guard(lock_);
    const PiResource* r = resources_.get(resource);
    if (r == nullptr || !r->held) return std::nullopt;
    return r->holder;
}

std::size_t PriorityInheritanceProtocol::waiterCount(PiHandle resource) const {
    std::lock_guard<MutexLock> guard(lock_);
    const PiResource* r = resources_.get(resource);
    return r == nullptr ? 0 : r->waiters.size();
}

std::optional<TaskPriorityState> PriorityInheritanceProtocol::taskState(PiHandle task) const {
    std::lock_guard<MutexLock> guard(lock_);
    const TaskPriorityState* t = tasks_.get(task);
    if (t == nullptr) return std::nullopt;
    return *t;
}

std::vector<PiChainEntry> PriorityInheritanceProtocol::chain(PiHandle task) const {
    std::vector<PiChainEntry> out;
    std::lock_guard<MutexLock> guard(lock_);

    PiHandle cur = task;
    while (out.size() < kMaxChainDepth) {
        const TaskPriorityState* t = tasks_.get(cur);
        if (t == nullptr || !t->blocked) break;
        const PiResource* r = resources_.get(t->blocked_on);
        if (r == nullptr || !r->held) break;
        const TaskPriorityState* h = tasks_.get(r->holder);

        PiChainEntry e;
        e.waiter                    = cur;
        e.resource                  = t->blocked_on;
        e.holder                    = r->holder;
        e.holder_effective_priority = h != nullptr ? h->effective_priority : 0;
        out.push_back(e);

        cur = r->holder;
    }
    return out;
}

PiStats PriorityInheritanceProtocol::stats() const {
    std::lock_guard<MutexLock> guard(lock_);
    PiStats s = stats_;
    s.tasks     = tasks_.size();
    s.resources = resources_.size();
    return s;
}
