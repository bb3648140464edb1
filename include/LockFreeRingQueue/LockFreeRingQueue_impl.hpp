#pragma once

#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include "Tool/Backoff.hpp"

template <class T>
auto LockFreeRingQueue<T>::roundUpToPowerOfTwo(size_type n) -> size_type {
    constexpr size_type kMaxPowerOfTwo = (std::numeric_limits<size_type>::max() >> 1) + 1;
    if (n > kMaxPowerOfTwo) {
        throw std::invalid_argument("LockFreeRingQueue capacity too large: " + std::to_string(n));
    }
    size_type result = 1;
    while (result < n) {
        result <<= 1;
    }
    return result;
}

template <class T>
LockFreeRingQueue<T>::LockFreeRingQueue(size_type capacity)
    : capacity_(roundUpToPowerOfTwo(capacity)),
      mask_(capacity_ - 1),
      cells_(std::make_unique<cell_type[]>(capacity_)) {}

template <class T>
LockFreeRingQueue<T>::~LockFreeRingQueue() noexcept {
    // 析构时没有并发访问：把 [head, tail) 中已发布的值析构掉
    size_type head = head_.load(std::memory_order_acquire);
    const size_type tail = tail_.load(std::memory_order_acquire);
    for (; head != tail; ++head) {
        cell_type& cell = cells_[head & mask_];
        if (cell.sequence.load(std::memory_order_acquire) == readySeq_(head)) {
            cell.destroy();
        }
    }
}

template <class T>
bool LockFreeRingQueue<T>::tryEnqueue(const value_type& v) {
    // 先在槽位之外完成可能抛异常的拷贝，预留之后只做 noexcept 的移动构造
    value_type copy(v);
    return tryEnqueue(std::move(copy));
}

template <class T>
bool LockFreeRingQueue<T>::tryEnqueue(value_type&& v) noexcept {
    size_type pos = tail_.load(std::memory_order_relaxed);
    Backoff backoff;

    for (;;) {
        cell_type& cell = cells_[pos & mask_];
        const size_type seq = cell.sequence.load(std::memory_order_acquire);
        const auto diff = static_cast<std::intptr_t>(seq - freeSeq_(pos));

        if (diff == 0) {
            if (tail_.compare_exchange_weak(pos, pos + 1,
                                            std::memory_order_relaxed,
                                            std::memory_order_relaxed)) {
                cell.construct(std::move(v));
                // release：值先于序号对消费者可见
                cell.sequence.store(readySeq_(pos), std::memory_order_release);
                return true;
            }
            // CAS 失败时 pos 已刷新
        } else if (diff < 0) {
            // 上一轮的值还没被取走：满
            return false;
        } else {
            pos = tail_.load(std::memory_order_relaxed);
        }
        backoff.pause();
    }
}

template <class T>
auto LockFreeRingQueue<T>::reserveHead_(size_type& pos) noexcept -> cell_type* {
    pos = head_.load(std::memory_order_relaxed);
    Backoff backoff;

    for (;;) {
        cell_type& cell = cells_[pos & mask_];
        const size_type seq = cell.sequence.load(std::memory_order_acquire);
        const auto diff = static_cast<std::intptr_t>(seq - readySeq_(pos));

        if (diff == 0) {
            if (head_.compare_exchange_weak(pos, pos + 1,
                                            std::memory_order_relaxed,
                                            std::memory_order_relaxed)) {
                return &cell;
            }
        } else if (diff < 0) {
            // 值尚未发布：空
            return nullptr;
        } else {
            pos = head_.load(std::memory_order_relaxed);
        }
        backoff.pause();
    }
}

template <class T>
bool LockFreeRingQueue<T>::tryDequeue(value_type& out) noexcept {
    size_type pos = 0;
    cell_type* cell = reserveHead_(pos);
    if (!cell) {
        return false;
    }

    out = std::move(cell->get());
    cell->destroy();
    // 让出槽位给下一轮（pos + capacity）的生产者
    cell->sequence.store(freeSeq_(pos + capacity_), std::memory_order_release);
    return true;
}

template <class T>
auto LockFreeRingQueue<T>::dequeue() noexcept -> std::optional<value_type> {
    size_type pos = 0;
    cell_type* cell = reserveHead_(pos);
    if (!cell) {
        return std::nullopt;
    }

    std::optional<value_type> result(std::move(cell->get()));
    cell->destroy();
    cell->sequence.store(freeSeq_(pos + capacity_), std::memory_order_release);
    return result;
}

template <class T>
bool LockFreeRingQueue<T>::isEmpty() const noexcept {
    return size() == 0;
}

template <class T>
bool LockFreeRingQueue<T>::isFull() const noexcept {
    return size() >= capacity_;
}

template <class T>
auto LockFreeRingQueue<T>::size() const noexcept -> size_type {
    const size_type head = head_.load(std::memory_order_acquire);
    const size_type tail = tail_.load(std::memory_order_acquire);
    if (tail <= head) {
        return 0;
    }
    return std::min(tail - head, capacity_);
}
