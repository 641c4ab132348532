//
// atomic.cpp - Spinlock
//
#include <core/atomic.h>

void Spinlock::acquire() {
    while (!locked.compare_exchange_v(false, true, ACQUIRE)) {
        tight_spin();
    }
}

void Spinlock::release() {
    locked.store(false, RELEASE);
}

bool Spinlock::held() const {
    return locked.load(RELAXED);
}
