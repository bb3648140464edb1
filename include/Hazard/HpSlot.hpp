// include/Hazard/HpSlot.hpp
#pragma once
#include <array>
#include <atomic>
#include <cstddef>

#include "Config/LfcConfig.hpp"
#include "Hazard/GCHook.hpp"
#include "Hazard/HpRetiredManager.hpp"

/**
 * @brief 危险指针注册表中的一条记录。
 *
 * 同一时刻至多被一个线程持有（in_use_），持有者独占 retired_ 链表。
 * 记录一旦挂入 HpSlotManager 的链表就不会被摘除，释放后可被其他线程复用，
 * next 在发布之后保持不变。
 */
class alignas(LfcConfig::kCacheLineSize) HpSlot {
public:
    static constexpr std::size_t kMaxPointers = LfcConfig::kMaxHazardPointers;

    HpSlot() noexcept;
    ~HpSlot() = default;

    HpSlot(const HpSlot&) = delete;
    HpSlot& operator=(const HpSlot&) = delete;

    // 槽位所有权
    bool tryAcquire() noexcept;
    void release() noexcept;
    bool isInUse() const noexcept;

    // 危险指针发布；protect 自带 seq_cst 栅栏，调用者随后重读源指针即可验证
    void protect(std::size_t index, const GCHook* p) noexcept;
    void clear(std::size_t index) noexcept;
    void clearAll() noexcept;

    std::size_t getHazardPointerCount() const noexcept;
    const GCHook* getHazardPointerAt(std::size_t index) const noexcept;

    HpRetiredManager& retired() noexcept { return retired_; }
    const HpRetiredManager& retired() const noexcept { return retired_; }

    HpSlot* next{nullptr};

private:
    std::array<std::atomic<const GCHook*>, kMaxPointers> hazard_ptrs_;
    std::atomic<bool> in_use_;
    HpRetiredManager retired_;
};
