#pragma once
#include <atomic>
#include <cstddef>
#include <optional>

#include "Config/LfcConfig.hpp"
#include "Hazard/HazardPointerOrganizer.hpp"
#include "Hazard/HpGuard.hpp"
#include "LockFreeQueue/QueueNode.hpp"
#include "Tool/AllocatorPolicies.hpp"

/**
 * @brief Michael-Scott 无锁队列（FIFO，无界）。
 *
 * head_ 始终指向当前哨兵，永不为空；tail_ 可能落后一个节点，
 * 任何观察到落后的线程都会帮忙推进。FIFO 顺序由 tail->next 的
 * CAS 成功顺序决定，而不是 tail_ 的推进顺序。
 */
template <class T, class AllocPolicy = DefaultHeapPolicy>
class LockFreeQueue {
public:
    using value_type = T;
    using node_type  = QueueNode<T>;
    using size_type  = std::size_t;

    // HP[0] 保护 head（出队）或 tail（入队）
    // HP[1] 保护 head->next（即将成为新哨兵、携带返回值的节点）
    static constexpr std::size_t kHazardPointers = 2;
    static_assert(kHazardPointers <= LfcConfig::kMaxHazardPointers, "not enough hazard pointers per slot");

public:
    LockFreeQueue();
    explicit LockFreeQueue(HazardPointerOrganizer& hp_organizer);
    ~LockFreeQueue() noexcept;

    LockFreeQueue(const LockFreeQueue&) = delete;
    LockFreeQueue& operator=(const LockFreeQueue&) = delete;

    void enqueue(const value_type& v);
    void enqueue(value_type&& v);
    bool tryDequeue(value_type& out) noexcept;
    std::optional<value_type> dequeue();
    bool isEmpty() const noexcept;

private:
    template<typename U>
    void enqueueImpl_(U&& v);

    // 成功时返回新哨兵（值在其中，受 HP[1] 保护），队列空返回 nullptr
    node_type* unlinkHead_(HpGuard& guard) noexcept;

    static void reclaimNode_(GCHook* hook) noexcept;

    // head_ 和 tail_ 各占一条缓存行，防止伪共享
    alignas(LfcConfig::kCacheLineSize) std::atomic<node_type*> head_;
    alignas(LfcConfig::kCacheLineSize) std::atomic<node_type*> tail_;

    HazardPointerOrganizer& hp_organizer_;
};

#include "LockFreeQueue/LockFreeQueue_impl.hpp"
