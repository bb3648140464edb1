#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <type_traits>

#include "Config/LfcConfig.hpp"
#include "LockFreeRingQueue/RingCell.hpp"

/**
 * @brief 有界 MPMC 环形队列（FIFO）。
 *
 * 容量向上取整到 2 的幂，下标为 counter & mask_，轮次为 counter / capacity_。
 * 每个槽位带序号：轮次 t 时 2t 表示空闲，2t + 1 表示值已就绪。
 * 生产者写完值以后才发布序号，消费者只在序号就绪时读取，
 * 因此不存在“tail 已推进但值尚未写入”的窗口；容量为 1 时两种状态也不会重合。
 *
 * tryEnqueue 在队列满时返回 false，实参保持原样（右值不会被移走）。
 */
template <class T>
class LockFreeRingQueue {
    static_assert(std::is_nothrow_move_constructible<T>::value,
                  "T must be nothrow move constructible: a reserved slot cannot be rolled back");

public:
    using value_type = T;
    using cell_type  = RingCell<T>;
    using size_type  = std::size_t;

public:
    explicit LockFreeRingQueue(size_type capacity);
    ~LockFreeRingQueue() noexcept;

    LockFreeRingQueue(const LockFreeRingQueue&) = delete;
    LockFreeRingQueue& operator=(const LockFreeRingQueue&) = delete;

    bool tryEnqueue(const value_type& v);
    bool tryEnqueue(value_type&& v) noexcept;
    bool tryDequeue(value_type& out) noexcept;
    std::optional<value_type> dequeue() noexcept;

    // 以下均为快照，不与并发修改构成事务
    bool isEmpty() const noexcept;
    bool isFull() const noexcept;
    size_type size() const noexcept;
    size_type capacity() const noexcept { return capacity_; }

    static size_type roundUpToPowerOfTwo(size_type n);

private:
    // 成功时返回已被本线程独占的、值已就绪的槽位
    cell_type* reserveHead_(size_type& pos) noexcept;

    size_type freeSeq_(size_type pos) const noexcept { return (pos / capacity_) * 2; }
    size_type readySeq_(size_type pos) const noexcept { return (pos / capacity_) * 2 + 1; }

    const size_type              capacity_;
    const size_type              mask_;
    std::unique_ptr<cell_type[]> cells_;

    alignas(LfcConfig::kCacheLineSize) std::atomic<size_type> head_{0};
    alignas(LfcConfig::kCacheLineSize) std::atomic<size_type> tail_{0};
};

#include "LockFreeRingQueue/LockFreeRingQueue_impl.hpp"
