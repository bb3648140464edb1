// include/Hazard/HazardPointerOrganizer.hpp
#pragma once

#include <cstddef>
#include <vector>

#include "Config/LfcConfig.hpp"
#include "Hazard/GCHook.hpp"
#include "Hazard/HpSlot.hpp"
#include "Hazard/HpSlotManager.hpp"
#include "Hazard/HpRetiredManager.hpp"

/**
 * @brief 危险指针回收的总入口：槽位注册表 + 延迟回收。
 *
 * 节点类型被 GCHook 擦除，所以一个 Organizer 可以同时服务栈和队列。
 * 除 drainAllRetired() 与析构外，所有接口都可以并发调用且不会阻塞。
 *
 * 用法：
 *   HpGuard guard(organizer);
 *   Node* p = guard.protectLoad(0, head_);
 *   ...
 *   guard.retire(p, &reclaimNode);
 */
class HazardPointerOrganizer {
public:
    explicit HazardPointerOrganizer(std::size_t scan_threshold = LfcConfig::kRetireScanThreshold) noexcept;
    ~HazardPointerOrganizer();

    HazardPointerOrganizer(const HazardPointerOrganizer&) = delete;
    HazardPointerOrganizer& operator=(const HazardPointerOrganizer&) = delete;
    HazardPointerOrganizer(HazardPointerOrganizer&&) = delete;
    HazardPointerOrganizer& operator=(HazardPointerOrganizer&&) = delete;

    // 未显式指定 Organizer 的容器共用这个实例
    static HazardPointerOrganizer& global();

    HpSlot* acquireSlot() noexcept;
    void releaseSlot(HpSlot* slot) noexcept;

    // slot 必须由调用线程持有
    void retire(HpSlot* slot, GCHook* node, GCHook::Reclaimer reclaim) noexcept;

    // 收拢所有空闲槽位的退休节点并回收未受保护的部分；quota 为 0 表示不限
    std::size_t collect(std::size_t quota = 0) noexcept;

    // 无视危险指针全部回收，只能在没有并发操作时调用
    std::size_t drainAllRetired() noexcept;

    std::size_t getSlotCount() const noexcept;
    std::size_t getRetiredCount() const noexcept;
    std::size_t getScanThreshold() const noexcept { return scan_threshold_; }

private:
    std::size_t scan_(HpRetiredManager& retired, std::size_t quota) noexcept;

    HpSlotManager     slot_manager_;
    const std::size_t scan_threshold_;
};
