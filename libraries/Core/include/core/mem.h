//
// mem.h - freestanding memory primitives
//

#ifndef HERONOS_MEM_H
#define HERONOS_MEM_H

#include <stddef.h>

extern "C" void* memset(void* dest, int value, size_t len);
extern "C" void* memcpy(void* dest, const void* src, size_t len);

#endif //HERONOS_MEM_H
