// include/Hazard/HpRetiredManager.hpp
#pragma once
#include <atomic>
#include <cstddef>
#include <vector>

#include "Hazard/GCHook.hpp"

/**
 * @brief 一条退休链表及其扫描回收逻辑。
 *
 * 每个 HpSlot 内嵌一个实例，只有当前持有该槽位的线程会修改它，
 * 因此链表本身不需要加锁；计数器是原子的，供其他线程读取诊断信息。
 */
class HpRetiredManager {
public:
    HpRetiredManager() noexcept = default;
    ~HpRetiredManager() noexcept;

    HpRetiredManager(const HpRetiredManager&)            = delete;
    HpRetiredManager& operator=(const HpRetiredManager&) = delete;

    void appendRetiredNode(GCHook* n) noexcept;
    void appendRetiredList(GCHook* head) noexcept;

    // 整条摘走，计数清零；调用者接管链表
    GCHook* stealList() noexcept;

    // hazard_snapshot 必须已排序；回收至多 quota 个（0 表示不限）
    std::size_t collectRetired(std::size_t                        quota,
                               const std::vector<const GCHook*>&  hazard_snapshot) noexcept;

    std::size_t drainAll() noexcept;
    std::size_t getRetiredCount() const noexcept;

private:
    GCHook*                   head_{nullptr};
    std::atomic<std::size_t>  count_{0};
};
