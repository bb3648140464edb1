// include/Hazard/HpGuard.hpp
#pragma once

#include <atomic>
#include <cstddef>

#include "Hazard/HazardPointerOrganizer.hpp"

/**
 * @brief 一次容器操作期间持有一个 HpSlot，析构时清空危险指针并归还槽位。
 */
class HpGuard {
public:
    explicit HpGuard(HazardPointerOrganizer& organizer) noexcept
        : organizer_(organizer), slot_(organizer.acquireSlot()) {}

    ~HpGuard() {
        organizer_.releaseSlot(slot_);
    }

    HpGuard(const HpGuard&) = delete;
    HpGuard& operator=(const HpGuard&) = delete;
    HpGuard(HpGuard&&) = delete;
    HpGuard& operator=(HpGuard&&) = delete;

    void protect(std::size_t index, const GCHook* p) noexcept {
        slot_->protect(index, p);
    }

    // 读取 src 并发布为危险指针，直到发布后的重读结果一致为止
    template <class Node>
    Node* protectLoad(std::size_t index, const std::atomic<Node*>& src) noexcept {
        Node* p = src.load(std::memory_order_acquire);
        for (;;) {
            slot_->protect(index, p);
            Node* again = src.load(std::memory_order_acquire);
            if (again == p) {
                return p;
            }
            p = again;
        }
    }

    void clear(std::size_t index) noexcept { slot_->clear(index); }
    void clearAll() noexcept { slot_->clearAll(); }

    void retire(GCHook* node, GCHook::Reclaimer reclaim) noexcept {
        organizer_.retire(slot_, node, reclaim);
    }

    HpSlot* slot() const noexcept { return slot_; }

private:
    HazardPointerOrganizer& organizer_;
    HpSlot*                 slot_;
};
