// src/Hazard/HazardPointerOrganizer.cpp
#include "Hazard/HazardPointerOrganizer.hpp"

#include <atomic>
#include <iostream>
#include <new>

#include "Tool/FatalError.hpp"

HazardPointerOrganizer::HazardPointerOrganizer(std::size_t scan_threshold) noexcept
    : scan_threshold_(scan_threshold == 0 ? 1 : scan_threshold) {}

HazardPointerOrganizer::~HazardPointerOrganizer() {
    std::size_t busy = 0;
    slot_manager_.forEachSlot([&busy](const HpSlot& slot) {
        if (slot.isInUse()) ++busy;
    });
    if (busy != 0) {
        std::cerr << "[HazardPointerOrganizer::~HazardPointerOrganizer] WARNING: "
                  << busy << " hazard slot(s) still in use during destruction." << std::endl;
    }
    drainAllRetired();
}

HazardPointerOrganizer& HazardPointerOrganizer::global() {
    static HazardPointerOrganizer instance;
    return instance;
}

HpSlot* HazardPointerOrganizer::acquireSlot() noexcept {
    return slot_manager_.acquireSlot();
}

void HazardPointerOrganizer::releaseSlot(HpSlot* slot) noexcept {
    slot_manager_.releaseSlot(slot);
}

void HazardPointerOrganizer::retire(HpSlot* slot, GCHook* node, GCHook::Reclaimer reclaim) noexcept {
    if (node == nullptr) return;
    if (slot == nullptr || reclaim == nullptr) {
        lfc::fatal("HazardPointerOrganizer::retire", "retire requires a held slot and a reclaimer");
    }
    node->gc_reclaim = reclaim;
    HpRetiredManager& retired = slot->retired();
    retired.appendRetiredNode(node);
    if (retired.getRetiredCount() >= scan_threshold_) {
        scan_(retired, 0);
    }
}

std::size_t HazardPointerOrganizer::collect(std::size_t quota) noexcept {
    HpSlot* mine = acquireSlot();

    // 把所有空闲槽位的退休链表搬到自己名下
    slot_manager_.forEachSlot([mine](HpSlot& slot) {
        if (&slot == mine || !slot.tryAcquire()) {
            return;
        }
        GCHook* stolen = slot.retired().stealList();
        slot.release();
        mine->retired().appendRetiredList(stolen);
    });

    std::size_t freed = scan_(mine->retired(), quota);
    releaseSlot(mine);
    return freed;
}

std::size_t HazardPointerOrganizer::drainAllRetired() noexcept {
    std::size_t freed = 0;
    slot_manager_.forEachSlot([&freed](HpSlot& slot) {
        freed += slot.retired().drainAll();
    });
    return freed;
}

std::size_t HazardPointerOrganizer::getSlotCount() const noexcept {
    return slot_manager_.getSlotCount();
}

std::size_t HazardPointerOrganizer::getRetiredCount() const noexcept {
    std::size_t total = 0;
    slot_manager_.forEachSlot([&total](const HpSlot& slot) {
        total += slot.retired().getRetiredCount();
    });
    return total;
}

std::size_t HazardPointerOrganizer::scan_(HpRetiredManager& retired, std::size_t quota) noexcept {
    if (retired.getRetiredCount() == 0) {
        return 0;
    }

    // 与 HpSlot::protect 中的栅栏配对
    std::atomic_thread_fence(std::memory_order_seq_cst);

    std::vector<const GCHook*> snapshot;
    try {
        snapshot.reserve(slot_manager_.getSlotCount() * HpSlot::kMaxPointers);
        slot_manager_.snapshotHazardPointers(snapshot);
    } catch (const std::bad_alloc&) {
        lfc::fatal("HazardPointerOrganizer::scan_", "out of memory while taking a hazard snapshot");
    }

    return retired.collectRetired(quota, snapshot);
}
