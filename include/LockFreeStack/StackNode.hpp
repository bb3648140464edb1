// StackNode.hpp
#pragma once

#include <cstddef>
#include <utility>

#include "Hazard/GCHook.hpp"

// Treiber 链式栈的最小节点
template <class T>
class StackNode : public GCHook {
public:
    StackNode* next{nullptr};          // 发布前写好，发布后不再修改，所以不需要原子
    T value;

    template <class... Args>
    explicit StackNode(Args&&... args)
        : next(nullptr), value(std::forward<Args>(args)...) {}

    StackNode(const StackNode&) = delete;
    StackNode& operator=(const StackNode&) = delete;

private:
    // 只允许经由 AllocPolicy（placement new）创建
    static void* operator new(std::size_t) = delete;
    static void* operator new[](std::size_t) = delete;
    static void operator delete(void*) = delete;
    static void operator delete[](void*) = delete;
};
