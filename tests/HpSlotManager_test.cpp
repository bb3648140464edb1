#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <set>
#include <thread>
#include <vector>

#include "Hazard/GCHook.hpp"
#include "Hazard/HpSlot.hpp"
#include "Hazard/HpSlotManager.hpp"

namespace {
struct TestNode : GCHook {
    explicit TestNode(int v) : value(v) {}
    int value;
};
} // namespace

// ---------- 1) 基础：protect / clear 可见性 ----------
TEST(HpSlotManagerTest, HpSlot_ProtectClear_BasicVisibility) {
    HpSlot slot;

    for (std::size_t i = 0; i < slot.getHazardPointerCount(); ++i) {
        EXPECT_EQ(slot.getHazardPointerAt(i), nullptr);
    }

    TestNode a(1);
    TestNode b(2);
    slot.protect(0, &a);
    slot.protect(1, &b);
    EXPECT_EQ(slot.getHazardPointerAt(0), &a);
    EXPECT_EQ(slot.getHazardPointerAt(1), &b);

    slot.clear(0);
    EXPECT_EQ(slot.getHazardPointerAt(0), nullptr);
    EXPECT_EQ(slot.getHazardPointerAt(1), &b);

    slot.clearAll();
    EXPECT_EQ(slot.getHazardPointerAt(1), nullptr);
}

// ---------- 2) 槽位所有权：独占获取，release 清空危险指针 ----------
TEST(HpSlotManagerTest, HpSlot_AcquireIsExclusive_ReleaseClears) {
    HpSlot slot;
    EXPECT_FALSE(slot.isInUse());
    ASSERT_TRUE(slot.tryAcquire());
    EXPECT_TRUE(slot.isInUse());
    EXPECT_FALSE(slot.tryAcquire());

    TestNode a(1);
    slot.protect(0, &a);
    slot.release();
    EXPECT_FALSE(slot.isInUse());
    EXPECT_EQ(slot.getHazardPointerAt(0), nullptr);
}

// ---------- 3) 管理器：释放后的槽位被复用，不会新建 ----------
TEST(HpSlotManagerTest, Manager_ReusesReleasedSlot) {
    HpSlotManager mgr;
    EXPECT_EQ(mgr.getSlotCount(), 0u);

    HpSlot* s1 = mgr.acquireSlot();
    ASSERT_NE(s1, nullptr);
    EXPECT_EQ(mgr.getSlotCount(), 1u);

    HpSlot* s2 = mgr.acquireSlot();
    ASSERT_NE(s2, nullptr);
    EXPECT_NE(s1, s2);
    EXPECT_EQ(mgr.getSlotCount(), 2u);

    mgr.releaseSlot(s1);
    HpSlot* s3 = mgr.acquireSlot();
    EXPECT_EQ(s3, s1);
    EXPECT_EQ(mgr.getSlotCount(), 2u);

    mgr.releaseSlot(s2);
    mgr.releaseSlot(s3);
}

// ---------- 4) 快照：只收集非空危险指针，结果有序 ----------
TEST(HpSlotManagerTest, Manager_SnapshotCollectsNonNullSorted) {
    HpSlotManager mgr;
    TestNode a(1), b(2), c(3);

    HpSlot* s1 = mgr.acquireSlot();
    HpSlot* s2 = mgr.acquireSlot();
    s1->protect(0, &c);
    s1->protect(1, &a);
    s2->protect(1, &b);

    std::vector<const GCHook*> snap;
    mgr.snapshotHazardPointers(snap);
    ASSERT_EQ(snap.size(), 3u);
    EXPECT_TRUE(std::is_sorted(snap.begin(), snap.end()));
    std::set<const GCHook*> got(snap.begin(), snap.end());
    EXPECT_EQ(got, (std::set<const GCHook*>{&a, &b, &c}));

    mgr.releaseSlot(s1);
    mgr.snapshotHazardPointers(snap);
    ASSERT_EQ(snap.size(), 1u);
    EXPECT_EQ(snap[0], &b);

    mgr.releaseSlot(s2);
}

// ---------- 5) 并发：同时持有的槽位两两不同 ----------
TEST(HpSlotManagerTest, Manager_ConcurrentAcquire_DistinctSlots) {
    HpSlotManager mgr;
    constexpr int kThreads = 8;
    constexpr int kRounds  = 2000;

    std::atomic<bool> collision{false};
    std::vector<std::thread> ths;
    for (int t = 0; t < kThreads; ++t) {
        ths.emplace_back([&] {
            for (int i = 0; i < kRounds; ++i) {
                HpSlot* s = mgr.acquireSlot();
                // 独占期间别人不可能再拿到它
                if (s->tryAcquire()) collision.store(true);
                mgr.releaseSlot(s);
            }
        });
    }
    for (auto& th : ths) th.join();

    EXPECT_FALSE(collision.load());
    EXPECT_GE(mgr.getSlotCount(), 1u);
    EXPECT_LE(mgr.getSlotCount(), static_cast<std::size_t>(kThreads));

    std::size_t busy = 0;
    mgr.forEachSlot([&busy](const HpSlot& s) { if (s.isInUse()) ++busy; });
    EXPECT_EQ(busy, 0u);
}
