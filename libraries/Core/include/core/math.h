//
// math.h - integer rounding and alignment helpers
//

#ifndef HERONOS_MATH_H
#define HERONOS_MATH_H

#include <stdint.h>
#include <stddef.h>

template <typename T>
constexpr bool isPowerOfTwo(T value){
    return value != 0 && (value & (value - 1)) == 0;
}

//Alignment must be a power of two. alignUp wraps around to 0 when the result does not fit in a uintptr_t,
//callers that care use checkedAlignUp instead.
constexpr uintptr_t alignDown(uintptr_t addr, const size_t alignment) {
    return addr & ~(static_cast<uintptr_t>(alignment) - 1);
}

constexpr uintptr_t alignUp(const uintptr_t addr, const size_t alignment) {
    return alignDown(addr + alignment - 1, alignment);
}

constexpr bool isAligned(const uintptr_t addr, const size_t alignment) {
    return (addr & (static_cast<uintptr_t>(alignment) - 1)) == 0;
}

//Returns false if aligning addr would overflow
constexpr bool checkedAlignUp(const uintptr_t addr, const size_t alignment, uintptr_t& out) {
    uintptr_t bumped;
    if (__builtin_add_overflow(addr, static_cast<uintptr_t>(alignment) - 1, &bumped)) {
        return false;
    }
    out = alignDown(bumped, alignment);
    return true;
}

#endif //HERONOS_MATH_H
