//
// atomic.h - compiler-intrinsic atomics and spinlocks
//

#ifndef HERONOS_ATOMIC_H
#define HERONOS_ATOMIC_H

#include <stddef.h>
#include <core/utility.h>

#ifdef __GNUC__
enum MemoryOrder : int{
    SEQ_CST = __ATOMIC_SEQ_CST,
    ACQUIRE = __ATOMIC_ACQUIRE,
    RELEASE = __ATOMIC_RELEASE,
    RELAXED = __ATOMIC_RELAXED
};
#else
#error "Compiler atomic intrinsics not supported"
#endif

template <typename T>
constexpr bool _use_intrinsic_atomic_ops = __is_trivially_copyable(T) && ((sizeof(T) == 1) || (sizeof(T) == 2) || (sizeof(T) == 4) || (sizeof(T) == 8));

inline void tight_spin() {
#if defined(__x86_64__) || defined(__i386__)
    __builtin_ia32_pause();
#elif defined(__aarch64__)
    asm volatile("yield");
#endif
}

template<typename T>
class Atomic {
    static_assert(_use_intrinsic_atomic_ops<T>, "Atomic<T> requires a lock-free intrinsic type");
    alignas(alignof(T)) T value;
public:
    Atomic(T t){
        store(t);
    }

    Atomic() = default;

    Atomic(const Atomic&) = delete;
    Atomic& operator=(const Atomic&) = delete;

    void store(T val, MemoryOrder order = SEQ_CST) {
        __atomic_store_n(&value, val, order);
    }

    T load(MemoryOrder order = SEQ_CST) const {
        return __atomic_load_n(&value, order);
    }

    bool compare_exchange_v(T expected, T desired,
                          MemoryOrder success_order = SEQ_CST,
                          MemoryOrder failure_order = RELAXED) {
        return __atomic_compare_exchange_n(&value, &expected, desired, false, success_order, failure_order);
    }

    Atomic& operator=(T val) {
        store(val);
        return *this;
    }

    operator T() const {
        return load();
    }
};

class Spinlock {
private:
    Atomic<bool> locked{false};

public:
    void acquire();
    void release();
    [[nodiscard]] bool held() const;
};

template<typename LockType>
class LockGuard {
    LockType& lock;

public:
    explicit LockGuard(LockType& l) : lock(l) {
        lock.acquire();
    }

    ~LockGuard() {
        lock.release();
    }

    // Non-copyable
    LockGuard(const LockGuard&) = delete;
    LockGuard& operator=(const LockGuard&) = delete;
};

#endif //HERONOS_ATOMIC_H
