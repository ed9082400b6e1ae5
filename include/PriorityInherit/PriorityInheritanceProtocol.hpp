// PriorityInherit/PriorityInheritanceProtocol.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "PriorityInherit/PiTypes.hpp"
#include "Tool/HandleArena.hpp"
#include "Tool/MutexLock.hpp"

/**
 * @brief 资源/任务优先级提升图，用于限制优先级反转。
 *
 * 每个任务维护一个按资源打标签的提升栈，effective = max(base, 栈中所有提升)。
 * 阻塞、取消、交接之后，从相关资源出发沿等待链逐跳重算持有者在该资源上的提升，
 * 链长最多 kMaxChainDepth 跳，畸形（含环）的等待图只会被截断，不会死循环。
 *
 * 内部锁使用 PTHREAD_PRIO_INHERIT 协议。
 */
class PriorityInheritanceProtocol {
public:
    static constexpr uint32_t kMaxChainDepth = 16;

    explicit PriorityInheritanceProtocol(PiProtocol protocol = PiProtocol::TransitiveInheritance);
    ~PriorityInheritanceProtocol() = default;

    PriorityInheritanceProtocol(const PriorityInheritanceProtocol&) = delete;
    PriorityInheritanceProtocol& operator=(const PriorityInheritanceProtocol&) = delete;

    // --- 注册 ---
    PiHandle registerResource(uint32_t ceiling);
    bool unregisterResource(PiHandle resource);
    PiHandle registerTask(uint32_t base_priority);
    bool unregisterTask(PiHandle task);

    // --- 获取 / 释放 ---
    PiAcquireResult acquire(PiHandle task, PiHandle resource, uint64_t now_ns);
    std::optional<PiHandle> release(PiHandle task, PiHandle resource, uint64_t now_ns);
    bool cancelWait(PiHandle task, uint64_t now_ns);

    // --- 优先级 ---
    std::optional<uint32_t> effectivePriority(PiHandle task) const;
    std::optional<uint32_t> basePriority(PiHandle task) const;
    bool setBasePriority(PiHandle task, uint32_t priority);

    // --- 查询 ---
    std::optional<PiHandle> holder(PiHandle resource) const;
    std::size_t waiterCount(PiHandle resource) const;
    std::optional<TaskPriorityState> taskState(PiHandle task) const;
    std::vector<PiChainEntry> chain(PiHandle task) const;
    PiStats stats() const;

    PiProtocol protocol() const noexcept { return protocol_; }

private:
    static void recomputeEffective_(TaskPriorityState& t) noexcept;
    // 返回 true 表示等待链在深度上限处被截断
    bool propagateBoost_(PiHandle start_resource);
    static void logDepthLimit_(PiHandle start_resource);
    void grantLocked_(PiHandle task, PiHandle resource, uint64_t now_ns);

    const PiProtocol protocol_;

    mutable MutexLock lock_{MutexLock::Protocol::PriorityInherit};
    HandleArena<TaskPriorityState> tasks_;
    HandleArena<PiResource> resources_;
    PiStats stats_{};
};
