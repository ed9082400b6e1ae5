#pragma once

#include <atomic>
#include <cstdint>

/**
 * @brief 一个 CPU 在 RcuReclaimer 中的专属槽位。
 *
 * 状态打包进一个 64 位原子量：bit0 为注册位，其余位为读侧嵌套深度。
 * 读侧进出只由该 CPU 自己调用，用 release 发布；宽限期检查用 acquire 读取，
 * 因此完成判定永远不会基于过期的 in_read_side。
 */
class CpuRcuSlot {
public:
    CpuRcuSlot() noexcept;
    ~CpuRcuSlot() = default;

    CpuRcuSlot(const CpuRcuSlot&) = delete;
    CpuRcuSlot& operator=(const CpuRcuSlot&) = delete;
    CpuRcuSlot(CpuRcuSlot&&) = delete;
    CpuRcuSlot& operator=(CpuRcuSlot&&) = delete;

    // CPU 生命周期
    bool tryRegister() noexcept;
    bool unregister() noexcept;

    // 读侧临界区，可重入
    bool enter(uint64_t now_ns) noexcept;
    bool leave() noexcept;

    // 静止态记录
    void noteQuiescent(uint64_t now_ns) noexcept;

    uint64_t loadState() const noexcept;
    uint64_t readEnterNs() const noexcept;
    uint64_t quiescentCount() const noexcept;
    uint64_t lastQuiescentNs() const noexcept;

    // --- 静态辅助函数 ---
    static bool isRegistered(uint64_t state) noexcept;
    static bool isInReadSide(uint64_t state) noexcept;
    static uint32_t unpackNesting(uint64_t state) noexcept;

private:
    static constexpr uint64_t kRegisteredBit = 1ULL << 0;
    static constexpr int      kNestingShift  = 1;

    static uint64_t pack_(uint32_t nesting, bool registered) noexcept;

    std::atomic<uint64_t> state_;
    std::atomic<uint64_t> read_enter_ns_{0};
    std::atomic<uint64_t> quiescent_count_{0};
    std::atomic<uint64_t> last_quiescent_ns_{0};
};
