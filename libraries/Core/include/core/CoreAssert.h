//
// CoreAssert.h - assertion hook for Core headers
//
// Core has no output or halting facility of its own. Failed checks are handed
// to Core::assertionFailure, which the embedding environment provides (the
// kernel routes it into PANIC).
//

#ifndef HERONOS_COREASSERT_H
#define HERONOS_COREASSERT_H

namespace Core {
    [[noreturn]] void assertionFailure(const char* file, int line, const char* message);
}

#ifdef DEBUG_BUILD
#define core_assert(condition, message) \
    do { \
        if (!(condition)) { \
            Core::assertionFailure(__FILE__, __LINE__, message); \
        } \
    } while(0)
#else
#define core_assert(condition, message) (void)(condition)
#endif

#endif //HERONOS_COREASSERT_H
