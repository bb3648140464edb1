#pragma once

#include <atomic>
#include <cstddef>
#include <optional>
#include <utility>

#include "Hazard/GCHook.hpp"

// Michael-Scott 队列节点。哨兵节点的 value 为空。
template <typename T>
class QueueNode : public GCHook {
public:
    using value_type = T;

    std::atomic<QueueNode<T>*> next;
    std::optional<value_type> value;

public:
    QueueNode() noexcept
        : next(nullptr), value() {}

    template <class... Args>
    explicit QueueNode(std::in_place_t, Args&&... args)
        : next(nullptr), value(std::in_place, std::forward<Args>(args)...) {}

    QueueNode(const QueueNode&) = delete;
    QueueNode& operator=(const QueueNode&) = delete;

private:
    // 只允许经由 AllocPolicy（placement new）创建
    static void* operator new(std::size_t) = delete;
    static void* operator new[](std::size_t) = delete;
    static void operator delete(void*) = delete;
    static void operator delete[](void*) = delete;
};
