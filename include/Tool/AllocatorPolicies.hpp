#pragma once

#include <new>
#include <utility>

// 默认策略：全局 operator new / delete。
// 分配失败时 std::bad_alloc 原样抛给调用者（push/enqueue 不会留下半链接的节点）。
struct DefaultHeapPolicy {
    template <class T, class... Args>
    static T* allocate(Args&&... args) {
        void* mem = ::operator new(sizeof(T));
        try {
            return ::new (mem) T(std::forward<Args>(args)...);
        } catch (...) {
            ::operator delete(mem);
            throw;
        }
    }

    template <class T>
    static void deallocate(T* p) noexcept {
        if (p) {
            p->~T();
            ::operator delete(p);
        }
    }
};
