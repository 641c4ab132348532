//
// mem.cpp
//

#include <core/mem.h>
#include <stdint.h>

//The hosted test build links against the C library's versions instead
#ifndef HERONOS_TESTING
extern "C" void* memset(void* dest, int value, size_t len) {
    auto* d = static_cast<uint8_t*>(dest);
    for(size_t i = 0; i < len; i++){
        d[i] = static_cast<uint8_t>(value);
    }
    return dest;
}

extern "C" void* memcpy(void* dest, const void* src, size_t len) {
    auto* d = static_cast<uint8_t*>(dest);
    const auto* s = static_cast<const uint8_t*>(src);
    for(size_t i = 0; i < len; i++){
        d[i] = s[i];
    }
    return dest;
}
#endif
