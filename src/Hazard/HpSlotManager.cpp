// src/Hazard/HpSlotManager.cpp
#include "Hazard/HpSlotManager.hpp"

#include <algorithm>
#include <new>

#include "Tool/FatalError.hpp"

HpSlotManager::~HpSlotManager() {
    HpSlot* current = head_.exchange(nullptr, std::memory_order_acquire);
    while (current) {
        HpSlot* next = current->next;
        delete current;
        current = next;
    }
}

HpSlot* HpSlotManager::acquireSlot() noexcept {
    // 1. 复用空闲槽位
    for (HpSlot* p = head_.load(std::memory_order_acquire); p; p = p->next) {
        if (p->tryAcquire()) {
            return p;
        }
    }

    // 2. 全部忙碌：新建并以持有状态挂入链表
    HpSlot* slot = new (std::nothrow) HpSlot();
    if (slot == nullptr) {
        lfc::fatal("HpSlotManager::acquireSlot", "out of memory while allocating a hazard slot");
    }
    if (!slot->tryAcquire()) {
        lfc::fatal("HpSlotManager::acquireSlot", "freshly allocated slot is already in use");
    }
    linkHead_(slot);
    return slot;
}

void HpSlotManager::releaseSlot(HpSlot* slot) noexcept {
    if (slot) {
        slot->release();
    }
}

std::size_t HpSlotManager::getSlotCount() const noexcept {
    return slot_count_.load(std::memory_order_relaxed);
}

void HpSlotManager::snapshotHazardPointers(std::vector<const GCHook*>& out) const {
    out.clear();
    forEachSlot([&out](const HpSlot& slot) {
        for (std::size_t i = 0; i < slot.getHazardPointerCount(); ++i) {
            const GCHook* ptr = slot.getHazardPointerAt(i);
            if (ptr) {
                out.push_back(ptr);
            }
        }
    });
    std::sort(out.begin(), out.end());
}

void HpSlotManager::linkHead_(HpSlot* slot) noexcept {
    HpSlot* old_head = head_.load(std::memory_order_relaxed);
    do {
        slot->next = old_head;
    } while (!head_.compare_exchange_weak(old_head, slot,
                                          std::memory_order_release,
                                          std::memory_order_relaxed));
    slot_count_.fetch_add(1, std::memory_order_relaxed);
}
