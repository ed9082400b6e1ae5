#include "FairLock/FairLockRegistry.hpp"

#include <mutex>

FairLockRegistry::Handle FairLockRegistry::createLock(const FairLockConfig& config) {
    std::lock_guard<MutexLock> guard(lock_);
    Handle h = locks_.insert(nullptr);
    // 锁 id 与句柄一致，便于日志对照
    *locks_.get(h) = std::make_unique<FairLock>(h, config);
    ++created_;
    return h;
}

bool FairLockRegistry::destroyLock(Handle handle) {
    std::lock_guard<MutexLock> guard(lock_);
    std::unique_ptr<FairLock>* slot = locks_.get(handle);
    if (slot == nullptr) {
        return false;
    }
    const FairLock& fl = **slot;
    if (fl.isHeld() || fl.waiterCount() != 0) {
        return false;
    }
    locks_.erase(handle);
    ++destroyed_;
    return true;
}

FairLock* FairLockRegistry::get(Handle handle) const {
    std::lock_guard<MutexLock> guard(lock_);
    const std::unique_ptr<FairLock>* slot = locks_.get(handle);
    return slot == nullptr ? nullptr : slot->get();
}

std::size_t FairLockRegistry::lockCount() const {
    std::lock_guard<MutexLock> guard(lock_);
    return locks_.size();
}

FairLockRegistryStats FairLockRegistry::stats() const {
    FairLockRegistryStats s;
    std::lock_guard<MutexLock> guard(lock_);
    s.locks     = locks_.size();
    s.created   = created_;
    s.destroyed = destroyed_;
    locks_.forEach([&s](FairLockRegistry::Handle, const std::unique_ptr<FairLock>& fl) {
        s.totals += fl->stats();
    });
    return s;
}
