// src/Hazard/HpSlot.cpp
#include "Hazard/HpSlot.hpp"

#include "Tool/FatalError.hpp"

HpSlot::HpSlot() noexcept
    : in_use_(false) {
    for (auto& hp_atomic : hazard_ptrs_) {
        hp_atomic.store(nullptr, std::memory_order_relaxed);
    }
}

bool HpSlot::tryAcquire() noexcept {
    if (in_use_.load(std::memory_order_relaxed)) {
        return false;
    }
    bool expected = false;
    return in_use_.compare_exchange_strong(expected, true,
                                           std::memory_order_acquire,
                                           std::memory_order_relaxed);
}

void HpSlot::release() noexcept {
    clearAll();
    // release：让下一个持有者看到我们对 retired_ 的全部修改
    in_use_.store(false, std::memory_order_release);
}

bool HpSlot::isInUse() const noexcept {
    return in_use_.load(std::memory_order_acquire);
}

void HpSlot::protect(std::size_t index, const GCHook* p) noexcept {
    if (index >= kMaxPointers) {
        lfc::fatal("HpSlot::protect", "hazard pointer index is out of bounds");
    }
    hazard_ptrs_[index].store(p, std::memory_order_release);
    // 与回收端扫描前的栅栏配对：要么回收者看到这个危险指针，
    // 要么我们随后的验证读看到节点已被摘下
    std::atomic_thread_fence(std::memory_order_seq_cst);
}

void HpSlot::clear(std::size_t index) noexcept {
    if (index >= kMaxPointers) {
        lfc::fatal("HpSlot::clear", "hazard pointer index is out of bounds");
    }
    hazard_ptrs_[index].store(nullptr, std::memory_order_release);
}

void HpSlot::clearAll() noexcept {
    for (auto& hp_atomic : hazard_ptrs_) {
        hp_atomic.store(nullptr, std::memory_order_release);
    }
}

std::size_t HpSlot::getHazardPointerCount() const noexcept {
    return kMaxPointers;
}

const GCHook* HpSlot::getHazardPointerAt(std::size_t index) const noexcept {
    if (index >= kMaxPointers) {
        lfc::fatal("HpSlot::getHazardPointerAt", "hazard pointer index is out of bounds");
    }
    return hazard_ptrs_[index].load(std::memory_order_acquire);
}
