#pragma once

#include <atomic>
#include <cstdint>

#include "Config/LfcConfig.hpp"

static_assert(sizeof(void*) == 8, "StampedTop packs a 48-bit pointer into a 64-bit word");

/**
 * @brief 栈顶字：低 48 位是节点指针，高 16 位是修改次数。
 *
 * 每次 casBump 成功都会让 stamp 加一。节点被弹出、释放、再以同一地址压回时，
 * 栈顶的整字也已经不同，持有旧快照的线程 CAS 必然失败（ABA）。
 * 独占一条缓存行，避免和栈的其他字段伪共享。
 */
template <class Node>
class alignas(LfcConfig::kCacheLineSize) StampedTop {
public:
    struct Snapshot {
        Node*         ptr{nullptr};
        std::uint16_t stamp{0};

        bool operator==(const Snapshot& rhs) const noexcept {
            return ptr == rhs.ptr && stamp == rhs.stamp;
        }
        bool operator!=(const Snapshot& rhs) const noexcept { return !(*this == rhs); }
    };

    StampedTop() noexcept : word_(0) {}

    StampedTop(const StampedTop&) = delete;
    StampedTop& operator=(const StampedTop&) = delete;

    Snapshot load(std::memory_order order) const noexcept {
        return decode_(word_.load(order));
    }

    // 成功时写入 {desired, expected.stamp + 1}；失败时 expected 刷新为当前值
    bool casBump(Snapshot& expected, Node* desired,
                 std::memory_order success, std::memory_order failure) noexcept {
        std::uint64_t seen = encode_(expected.ptr, expected.stamp);
        const std::uint64_t next =
            encode_(desired, static_cast<std::uint16_t>(expected.stamp + 1));
        if (word_.compare_exchange_weak(seen, next, success, failure)) {
            return true;
        }
        expected = decode_(seen);
        return false;
    }

private:
    static constexpr unsigned      kAddrBits = 48;
    static constexpr std::uint64_t kAddrMask = (std::uint64_t{1} << kAddrBits) - 1;

    static std::uint64_t encode_(Node* p, std::uint16_t stamp) noexcept {
        const auto addr = static_cast<std::uint64_t>(reinterpret_cast<std::uintptr_t>(p));
        return (std::uint64_t{stamp} << kAddrBits) | (addr & kAddrMask);
    }

    static Snapshot decode_(std::uint64_t word) noexcept {
        // 左移再算术右移，恢复 48 位地址的符号扩展（规范地址）
        const auto addr = static_cast<std::intptr_t>(word << (64 - kAddrBits)) >> (64 - kAddrBits);
        return { reinterpret_cast<Node*>(addr), static_cast<std::uint16_t>(word >> kAddrBits) };
    }

    std::atomic<std::uint64_t> word_;
};
