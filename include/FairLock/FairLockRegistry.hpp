// FairLock/FairLockRegistry.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

#include "FairLock/FairLock.hpp"
#include "Tool/HandleArena.hpp"
#include "Tool/MutexLock.hpp"

struct FairLockRegistryStats {
    std::size_t locks{0};
    uint64_t created{0};
    uint64_t destroyed{0};
    FairLockStats totals{};
};

/**
 * @brief 按句柄管理一组 FairLock。
 *
 * 句柄带代数，destroyLock 之后旧句柄 get() 返回 nullptr。
 * get() 返回的指针在对应 destroyLock 之前有效。
 */
class FairLockRegistry {
public:
    using Handle = HandleArena<std::unique_ptr<FairLock>>::handle_type;

    FairLockRegistry() = default;
    ~FairLockRegistry() = default;

    FairLockRegistry(const FairLockRegistry&) = delete;
    FairLockRegistry& operator=(const FairLockRegistry&) = delete;

    Handle createLock(const FairLockConfig& config = FairLockConfig{});
    bool destroyLock(Handle handle);

    FairLock* get(Handle handle) const;
    std::size_t lockCount() const;
    FairLockRegistryStats stats() const;

private:
    mutable MutexLock lock_;
    HandleArena<std::unique_ptr<FairLock>> locks_;
    uint64_t created_{0};
    uint64_t destroyed_{0};
};
