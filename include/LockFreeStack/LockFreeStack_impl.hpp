// LockFreeStack_impl.hpp
#pragma once

#include <utility>

#include "Tool/Backoff.hpp"

template <class T, class AllocPolicy>
LockFreeStack<T, AllocPolicy>::LockFreeStack() noexcept
    : LockFreeStack(HazardPointerOrganizer::global()) {}

template <class T, class AllocPolicy>
LockFreeStack<T, AllocPolicy>::LockFreeStack(HazardPointerOrganizer& hp_organizer) noexcept
    : hp_organizer_(hp_organizer) {}


template <class T, class AllocPolicy>
LockFreeStack<T, AllocPolicy>::~LockFreeStack() noexcept {
    // 析构时不再有并发访问，剩余节点直接释放，每个恰好一次
    node_type* current = top_.load(std::memory_order_acquire).ptr;
    while (current) {
        node_type* next = current->next;
        AllocPolicy::deallocate(current);
        current = next;
    }
}


template <class T, class AllocPolicy>
void LockFreeStack<T, AllocPolicy>::push(const value_type& v) {
    pushImpl_(v);
}

template <class T, class AllocPolicy>
void LockFreeStack<T, AllocPolicy>::push(value_type&& v) {
    pushImpl_(std::move(v));
}

template <class T, class AllocPolicy>
template <typename U>
void LockFreeStack<T, AllocPolicy>::pushImpl_(U&& v) {
    auto* new_node = AllocPolicy::template allocate<node_type>(std::forward<U>(v));

    auto current = top_.load(std::memory_order_acquire);
    Backoff backoff;

    for (;;) {
        new_node->next = current.ptr;
        // release：节点内容先于 top 的更新对弹出者可见
        if (top_.casBump(current, new_node, std::memory_order_release, std::memory_order_acquire)) {
            return;
        }
        backoff.pause();
    }
}


template <class T, class AllocPolicy>
auto LockFreeStack<T, AllocPolicy>::unlinkTop_(HpGuard& guard) noexcept -> node_type* {
    Backoff backoff;

    for (;;) {
        auto old_top = top_.load(std::memory_order_acquire);
        if (!old_top.ptr) {
            guard.clear(0);
            return nullptr;
        }

        guard.protect(0, old_top.ptr);

        // 发布之后 top 没变，说明 old_top 尚未被摘下，也就不会被回收
        if (old_top != top_.load(std::memory_order_acquire)) {
            continue;
        }

        node_type* next = old_top.ptr->next;

        if (top_.casBump(old_top, next,
                         std::memory_order_acq_rel,
                         std::memory_order_relaxed)) {
            return old_top.ptr;
        }
        backoff.pause();
    }
}

template <class T, class AllocPolicy>
bool LockFreeStack<T, AllocPolicy>::tryPop(value_type& out) noexcept {
    HpGuard guard(hp_organizer_);
    node_type* node = unlinkTop_(guard);
    if (!node) {
        return false;
    }

    out = std::move(node->value);
    guard.clear(0);
    guard.retire(node, &reclaimNode_);
    return true;
}

template <class T, class AllocPolicy>
auto LockFreeStack<T, AllocPolicy>::pop() -> std::optional<value_type> {
    HpGuard guard(hp_organizer_);
    node_type* node = unlinkTop_(guard);
    if (!node) {
        return std::nullopt;
    }

    std::optional<value_type> result(std::move(node->value));
    guard.clear(0);
    guard.retire(node, &reclaimNode_);
    return result;
}

template <class T, class AllocPolicy>
bool LockFreeStack<T, AllocPolicy>::isEmpty() const noexcept {
    return top_.load(std::memory_order_acquire).ptr == nullptr;
}

template <class T, class AllocPolicy>
void LockFreeStack<T, AllocPolicy>::reclaimNode_(GCHook* hook) noexcept {
    AllocPolicy::deallocate(static_cast<node_type*>(hook));
}
