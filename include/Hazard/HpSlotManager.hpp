// include/Hazard/HpSlotManager.hpp
#pragma once
#include <atomic>
#include <cstddef>
#include <vector>

#include "Hazard/HpSlot.hpp"

/**
 * @brief 无锁的 HpSlot 注册表。
 *
 * 槽位以头插方式 CAS 挂入单链表，析构前从不摘除，因此遍历不需要任何锁。
 * 获取槽位时先尝试复用空闲记录，全部忙碌时才分配新记录。
 */
class HpSlotManager {
public:
    HpSlotManager() noexcept = default;
    ~HpSlotManager();

    HpSlotManager(const HpSlotManager&) = delete;
    HpSlotManager& operator=(const HpSlotManager&) = delete;
    HpSlotManager(HpSlotManager&&) = delete;
    HpSlotManager& operator=(HpSlotManager&&) = delete;

    HpSlot* acquireSlot() noexcept;
    void releaseSlot(HpSlot* slot) noexcept;

    std::size_t getSlotCount() const noexcept;

    // 收集所有非空危险指针，结果已排序
    void snapshotHazardPointers(std::vector<const GCHook*>& out) const;

    template<typename Callable>
    void forEachSlot(Callable func) const;

private:
    void linkHead_(HpSlot* slot) noexcept;

    std::atomic<HpSlot*>     head_{nullptr};
    std::atomic<std::size_t> slot_count_{0};
};


template<typename Callable>
void HpSlotManager::forEachSlot(Callable func) const {
    for (HpSlot* p = head_.load(std::memory_order_acquire); p; p = p->next) {
        func(*p);
    }
}
