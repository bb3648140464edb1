// LockFreeStack/LockFreeStack.hpp
#pragma once

#include <atomic>
#include <cstddef>
#include <optional>

#include "Config/LfcConfig.hpp"
#include "Hazard/HazardPointerOrganizer.hpp"
#include "Hazard/HpGuard.hpp"
#include "LockFreeStack/StackNode.hpp"
#include "LockFreeStack/StampedTop.hpp"
#include "Tool/AllocatorPolicies.hpp"

/**
 * @brief Treiber 无锁栈（LIFO）。
 *
 * top 是带 16 位版本号的打包指针（StampedTop）；弹出的节点交给 HazardPointerOrganizer
 * 延迟回收，不会在其他线程仍可能解引用时被释放。
 * push 只在分配失败时抛 std::bad_alloc；tryPop/pop 在栈空时立即返回。
 */
template <class T, class AllocPolicy = DefaultHeapPolicy>
class LockFreeStack {
public:
    using value_type = T;
    using node_type  = StackNode<T>;
    using size_type  = std::size_t;

    static constexpr std::size_t kHazardPointers = 1;
    static_assert(kHazardPointers <= LfcConfig::kMaxHazardPointers, "not enough hazard pointers per slot");

public:
    LockFreeStack() noexcept;
    explicit LockFreeStack(HazardPointerOrganizer& hp_organizer) noexcept;
    ~LockFreeStack() noexcept;

    LockFreeStack(const LockFreeStack&) = delete;
    LockFreeStack& operator=(const LockFreeStack&) = delete;

    void push(const value_type& v);
    void push(value_type&& v);
    bool tryPop(value_type& out) noexcept;
    std::optional<value_type> pop();
    bool isEmpty() const noexcept;

private:
    template <typename U>
    void pushImpl_(U&& v);

    // 成功时返回已摘下的节点，调用者负责取值并 retire
    node_type* unlinkTop_(HpGuard& guard) noexcept;

    static void reclaimNode_(GCHook* hook) noexcept;

    StampedTop<node_type> top_;
    HazardPointerOrganizer& hp_organizer_;
};

// 在头文件末尾包含实现，实现 Header-Only
#include "LockFreeStack/LockFreeStack_impl.hpp"
