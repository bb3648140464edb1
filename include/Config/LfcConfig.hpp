#pragma once

#include <cstddef>
#include <cstdint>


class LfcConfig {
public:
    // ---- 编译期常量（调优相关）----
    static constexpr std::size_t   kCacheLineSize       = 64;    // head/tail 等热点字段的对齐粒度
    static constexpr std::size_t   kMaxHazardPointers   = 2;     // 每个槽位的危险指针数（队列需要 2 个）
    static constexpr std::size_t   kRetireScanThreshold = 64;    // 退休链表达到该长度时触发一次扫描
    static constexpr std::uint32_t kBackoffMaxSpins     = 1024;  // 指数退避的自旋上限，超过后改为 yield

    LfcConfig() = delete;
};
