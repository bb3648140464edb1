#pragma once

#include <cstdint>
#include <thread>

#if defined(__x86_64__) || defined(__i386__)
#include <immintrin.h>
#endif

#include "Config/LfcConfig.hpp"

// CPU 自旋提示
inline void cpuRelax() noexcept {
#if defined(__x86_64__) || defined(__i386__)
    _mm_pause();
#elif defined(__aarch64__)
    asm volatile("yield" ::: "memory");
#else
    std::this_thread::yield();
#endif
}

/**
 * @brief CAS 失败后的指数退避。
 *
 * 每次 pause() 自旋 spins_ 次后翻倍，超过 kBackoffMaxSpins 以后
 * 改为 std::this_thread::yield()，把 CPU 让给持有进度的线程。
 * 每个重试循环在栈上持有一个实例即可，不需要跨线程共享。
 */
class Backoff {
public:
    Backoff() noexcept : spins_(1) {}

    void pause() noexcept {
        if (spins_ <= LfcConfig::kBackoffMaxSpins) {
            for (std::uint32_t i = 0; i < spins_; ++i) {
                cpuRelax();
            }
            spins_ <<= 1;
        } else {
            std::this_thread::yield();
        }
    }

private:
    std::uint32_t spins_;
};
