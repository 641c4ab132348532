//
// kassert.h - debug-build assertions for kernel code
//

#ifndef HERONOS_KASSERT_H
#define HERONOS_KASSERT_H

#include <panic.h>

#ifdef DEBUG_BUILD
#define kassert_base(condition, ...) do { if(!(condition)) PANIC(__VA_ARGS__); } while(0)
#define kassert(condition, ...) kassert_base((condition), "Assert failed: ", __VA_ARGS__)
#define kassertNotReached(...) kassert_base(false, "Assert not reached ", __VA_ARGS__)
#else
#define kassert(condition, ...) (void)(condition)
#define kassertNotReached(...)
#endif

#endif //HERONOS_KASSERT_H
