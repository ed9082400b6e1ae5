// PriorityInherit/PiTypes.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

enum class PiProtocol : uint8_t {
    DirectInheritance,
    TransitiveInheritance,
    ImmediateCeiling,
};

enum class PiAcquireResult : uint8_t {
    Acquired,
    Blocked,
    AlreadyHeld,
    Invalid,
};

using PiHandle = uint64_t;

// 一次提升：来自哪个资源，提升到多少；from_ceiling 表示持有即生效的天花板提升
struct PiBoost {
    PiHandle resource{0};
    uint32_t priority{0};
    bool from_ceiling{false};
};

struct TaskPriorityState {
    uint32_t base_priority{0};
    uint32_t effective_priority{0};
    std::vector<PiBoost> boosts;
    std::vector<PiHandle> held;
    PiHandle blocked_on{0};
    bool blocked{false};
    uint64_t blocked_since_ns{0};
};

struct PiResource {
    uint32_t ceiling{0};
    PiHandle holder{0};
    bool held{false};
    uint64_t acquire_ns{0};
    std::vector<PiHandle> waiters;      // 按到达顺序
};

// 等待链上的一跳：waiter 阻塞在 resource 上，resource 由 holder 持有
struct PiChainEntry {
    PiHandle waiter{0};
    PiHandle resource{0};
    PiHandle holder{0};
    uint32_t holder_effective_priority{0};
};

struct PiStats {
    std::size_t tasks{0};
    std::size_t resources{0};
    uint64_t acquisitions{0};
    uint64_t contended{0};
    uint64_t releases{0};
    uint64_t handoffs{0};
    uint64_t cancellations{0};
    uint64_t boosts_applied{0};
    uint64_t ceiling_boosts{0};
    uint64_t depth_limit_hits{0};
    uint32_t max_chain_depth{0};
};
