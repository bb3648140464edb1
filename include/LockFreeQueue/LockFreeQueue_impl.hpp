#pragma once

#include <utility>

#include "Tool/Backoff.hpp"
#include "Tool/FatalError.hpp"

template <class T, class AllocPolicy>
LockFreeQueue<T, AllocPolicy>::LockFreeQueue()
    : LockFreeQueue(HazardPointerOrganizer::global()) {}

template <class T, class AllocPolicy>
LockFreeQueue<T, AllocPolicy>::LockFreeQueue(HazardPointerOrganizer& hp_organizer)
    : hp_organizer_(hp_organizer)
{
    auto* sentinel = AllocPolicy::template allocate<node_type>();
    head_.store(sentinel, std::memory_order_relaxed);
    tail_.store(sentinel, std::memory_order_relaxed);
}

template <class T, class AllocPolicy>
LockFreeQueue<T, AllocPolicy>::~LockFreeQueue() noexcept {
    // 从哨兵开始整条链释放：剩余元素 + 哨兵本身
    node_type* current = head_.load(std::memory_order_acquire);
    while (current) {
        node_type* next = current->next.load(std::memory_order_relaxed);
        AllocPolicy::deallocate(current);
        current = next;
    }
}

template <class T, class AllocPolicy>
void LockFreeQueue<T, AllocPolicy>::enqueue(const value_type& v) {
    enqueueImpl_(v);
}

template <class T, class AllocPolicy>
void LockFreeQueue<T, AllocPolicy>::enqueue(value_type&& v) {
    enqueueImpl_(std::move(v));
}

template <class T, class AllocPolicy>
template<typename U>
void LockFreeQueue<T, AllocPolicy>::enqueueImpl_(U&& v) {
    auto* new_node = AllocPolicy::template allocate<node_type>(std::in_place, std::forward<U>(v));

    HpGuard guard(hp_organizer_);
    Backoff backoff;

    for (;;) {
        // tail 可能已被出队者摘下并退休，必须先保护再解引用
        node_type* old_tail = guard.protectLoad(0, tail_);
        node_type* next = old_tail->next.load(std::memory_order_acquire);

        if (old_tail != tail_.load(std::memory_order_acquire)) {
            continue;
        }

        if (next != nullptr) {
            // tail 落后：帮忙推进后重试
            tail_.compare_exchange_weak(old_tail, next,
                                        std::memory_order_release,
                                        std::memory_order_relaxed);
            continue;
        }

        node_type* null_next = nullptr;
        if (old_tail->next.compare_exchange_weak(null_next, new_node,
                                                 std::memory_order_release,
                                                 std::memory_order_relaxed)) {
            // 尽力推进 tail，失败说明别人已经帮忙推进
            tail_.compare_exchange_strong(old_tail, new_node,
                                          std::memory_order_release,
                                          std::memory_order_relaxed);
            return;
        }
        backoff.pause();
    }
}


template <class T, class AllocPolicy>
auto LockFreeQueue<T, AllocPolicy>::unlinkHead_(HpGuard& guard) noexcept -> node_type* {
    Backoff backoff;

    for (;;) {
        // 1. 读取并保护 head
        node_type* old_head = guard.protectLoad(0, head_);
        if (old_head == nullptr) {
            lfc::fatal("LockFreeQueue::unlinkHead_", "head became null");
        }

        // 2. 读取 tail 与 head->next，并保护 next
        node_type* old_tail = tail_.load(std::memory_order_acquire);
        node_type* first_node = old_head->next.load(std::memory_order_acquire);
        guard.protect(1, first_node);

        // 3. head 未变，则 first_node 仍链在 head 之后，尚未退休
        if (old_head != head_.load(std::memory_order_acquire)) {
            continue;
        }

        // 4. 队列为空或 tail 落后
        if (old_head == old_tail) {
            if (first_node == nullptr) {
                guard.clearAll();
                return nullptr;
            }
            tail_.compare_exchange_weak(old_tail, first_node,
                                        std::memory_order_release,
                                        std::memory_order_relaxed);
            continue;
        }

        // head != tail 时 head->next 一定存在
        if (first_node == nullptr) {
            lfc::fatal("LockFreeQueue::unlinkHead_", "head differs from tail but has no successor");
        }

        // 5. 摘下旧哨兵，first_node 成为新哨兵
        if (head_.compare_exchange_strong(old_head, first_node,
                                          std::memory_order_acq_rel,
                                          std::memory_order_relaxed)) {
            guard.clear(0);
            guard.retire(old_head, &reclaimNode_);
            return first_node;
        }
        backoff.pause();
    }
}

template <class T, class AllocPolicy>
bool LockFreeQueue<T, AllocPolicy>::tryDequeue(value_type& out) noexcept {
    HpGuard guard(hp_organizer_);
    node_type* new_sentinel = unlinkHead_(guard);
    if (!new_sentinel) {
        return false;
    }

    // 只有 CAS 胜者会碰这个值；节点仍受 HP[1] 保护
    out = std::move(*new_sentinel->value);
    new_sentinel->value.reset();
    return true;
}

template <class T, class AllocPolicy>
auto LockFreeQueue<T, AllocPolicy>::dequeue() -> std::optional<value_type> {
    HpGuard guard(hp_organizer_);
    node_type* new_sentinel = unlinkHead_(guard);
    if (!new_sentinel) {
        return std::nullopt;
    }

    std::optional<value_type> result(std::move(*new_sentinel->value));
    new_sentinel->value.reset();
    return result;
}

template <class T, class AllocPolicy>
bool LockFreeQueue<T, AllocPolicy>::isEmpty() const noexcept {
    HpGuard guard(hp_organizer_);
    node_type* head = guard.protectLoad(0, head_);
    return head->next.load(std::memory_order_acquire) == nullptr;
}

template <class T, class AllocPolicy>
void LockFreeQueue<T, AllocPolicy>::reclaimNode_(GCHook* hook) noexcept {
    AllocPolicy::deallocate(static_cast<node_type*>(hook));
}
