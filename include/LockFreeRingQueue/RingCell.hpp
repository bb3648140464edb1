#pragma once

#include <atomic>
#include <cstddef>
#include <new>
#include <utility>

/**
 * @brief 环形队列的一个槽位：序号 + 未初始化的存储。
 *
 * 对位置 pos（pos & mask 映射到本槽，轮次 t = pos / cap）：
 *   sequence == 2t           槽空，等待第 t 轮的生产者
 *   sequence == 2t + 1       值已写入，等待消费者
 * 消费者取走值后写入 2(t + 1)，留给下一轮。
 */
template <class T>
class RingCell {
public:
    std::atomic<std::size_t> sequence{0};

    RingCell() noexcept = default;
    ~RingCell() = default;

    RingCell(const RingCell&) = delete;
    RingCell& operator=(const RingCell&) = delete;

    template <class... Args>
    void construct(Args&&... args) {
        ::new (static_cast<void*>(storage_)) T(std::forward<Args>(args)...);
    }

    T& get() noexcept {
        return *std::launder(reinterpret_cast<T*>(storage_));
    }

    void destroy() noexcept {
        get().~T();
    }

private:
    alignas(T) unsigned char storage_[sizeof(T)];
};
