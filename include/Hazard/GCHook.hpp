#pragma once

// 侵入式回收头：所有需要经由危险指针回收的节点都继承它。
// gc_next 只给回收器串退休链表用，绝不能和容器自己的 next 混用。
struct GCHook {
    using Reclaimer = void (*)(GCHook*) noexcept;

    GCHook* gc_next = nullptr;
    Reclaimer gc_reclaim = nullptr;   // retire 时写入，由具体容器按自己的 AllocPolicy 释放
};
