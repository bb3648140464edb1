// src/Hazard/HpRetiredManager.cpp
#include "Hazard/HpRetiredManager.hpp"

#include <algorithm>
#include <utility>

#include "Tool/FatalError.hpp"

namespace {

void reclaimOne(GCHook* n) noexcept {
    if (n->gc_reclaim == nullptr) {
        lfc::fatal("HpRetiredManager", "retired node has no reclaimer");
    }
    n->gc_reclaim(n);
}

} // namespace

HpRetiredManager::~HpRetiredManager() noexcept {
    drainAll();
}

void HpRetiredManager::appendRetiredNode(GCHook* n) noexcept {
    if (!n) return;
    n->gc_next = head_;
    head_ = n;
    count_.fetch_add(1, std::memory_order_relaxed);
}

void HpRetiredManager::appendRetiredList(GCHook* head) noexcept {
    if (!head) return;
    GCHook* tail = head;
    std::size_t count = 1;
    while (tail->gc_next) {
        tail = tail->gc_next;
        ++count;
    }
    tail->gc_next = head_;
    head_ = head;
    count_.fetch_add(count, std::memory_order_relaxed);
}

GCHook* HpRetiredManager::stealList() noexcept {
    count_.store(0, std::memory_order_relaxed);
    return std::exchange(head_, nullptr);
}

std::size_t HpRetiredManager::collectRetired(std::size_t quota,
                                             const std::vector<const GCHook*>& hazard_snapshot) noexcept {
    if (quota == 0) {
        quota = static_cast<std::size_t>(-1);
    }

    GCHook* keep_head = nullptr;
    GCHook* current = std::exchange(head_, nullptr);
    std::size_t freed_count = 0;
    std::size_t kept_count = 0;

    while (current) {
        GCHook* next = current->gc_next;
        if (freed_count < quota &&
            !std::binary_search(hazard_snapshot.begin(), hazard_snapshot.end(),
                                static_cast<const GCHook*>(current))) {
            reclaimOne(current);
            ++freed_count;
        } else {
            current->gc_next = keep_head;
            keep_head = current;
            ++kept_count;
        }
        current = next;
    }

    head_ = keep_head;
    count_.store(kept_count, std::memory_order_relaxed);
    return freed_count;
}

std::size_t HpRetiredManager::drainAll() noexcept {
    GCHook* current = std::exchange(head_, nullptr);
    std::size_t freed_count = 0;
    while (current) {
        GCHook* next = current->gc_next;
        reclaimOne(current);
        current = next;
        ++freed_count;
    }
    count_.store(0, std::memory_order_relaxed);
    return freed_count;
}

std::size_t HpRetiredManager::getRetiredCount() const noexcept {
    return count_.load(std::memory_order_relaxed);
}
