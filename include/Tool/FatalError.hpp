#pragma once

namespace lfc {

// 协议不变量被破坏（逻辑缺陷）时使用：打印后立即终止进程，不可恢复。
[[noreturn]] void fatal(const char* where, const char* what) noexcept;

} // namespace lfc
