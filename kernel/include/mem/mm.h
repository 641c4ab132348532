//
// mm.h - kernel heap front-end and the hand-off from boot memory
//

#ifndef HERONOS_MM_H
#define HERONOS_MM_H

#include <stddef.h>
#include <new>

namespace kernel::mm{
    class EarlyMemory;

    //The general-purpose allocator that takes over from early memory
    class HeapBackend{
    public:
        virtual ~HeapBackend() = default;
        virtual void* allocate(size_t size, std::align_val_t align) = 0;
        virtual void free(void* ptr) = 0;
    };

    //Serve kmalloc from early memory until a backend is installed
    void attachEarlyMemory(EarlyMemory& memory);
    //Retires the attached early memory; every later kmalloc goes to backend. Pointers that came
    //from early memory are still returned to it by kfree.
    void installHeapBackend(HeapBackend& backend);

#ifdef HERONOS_TESTING
    void resetHeapRoutingForTesting();
#endif
}

#endif //HERONOS_MM_H
