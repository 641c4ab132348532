//
// kmalloc.cpp - routes kernel heap traffic to early memory or the installed backend
//

#include <kernel.h>
#include <kassert.h>
#include <mem/mm.h>
#include <mem/EarlyMemory.h>

namespace kernel::mm{
    namespace {
        EarlyMemory* earlyMemory = nullptr;
        HeapBackend* heapBackend = nullptr;
    }

    void attachEarlyMemory(EarlyMemory& memory) {
        kassert(heapBackend == nullptr, "Early memory attached after heap hand-off");
        earlyMemory = &memory;
    }

    void installHeapBackend(HeapBackend& backend) {
        if (earlyMemory != nullptr) {
            earlyMemory -> retire();
        }
        heapBackend = &backend;
        log(LoggingImportance::IMPORTANT) << "Kernel heap handed off from early memory\n";
    }

#ifdef HERONOS_TESTING
    void resetHeapRoutingForTesting() {
        earlyMemory = nullptr;
        heapBackend = nullptr;
    }
#endif
}

namespace kernel{
    void* kmalloc(size_t size, std::align_val_t align){
        if (mm::heapBackend != nullptr) {
            return mm::heapBackend -> allocate(size, align);
        }
        if (mm::earlyMemory != nullptr) {
            return mm::earlyMemory -> allocate(size, align);
        }
        return nullptr;
    }

    void kfree(void* ptr){
        if(ptr == nullptr){
            return;
        }
        if (mm::earlyMemory != nullptr && mm::earlyMemory -> owns(ptr)) {
            mm::earlyMemory -> free(ptr);
            return;
        }
        if (mm::heapBackend != nullptr) {
            mm::heapBackend -> free(ptr);
            return;
        }
        kassertNotReached("kfree of a pointer no allocator owns: ", ptr);
    }
}

#ifndef HERONOS_TESTING
void *operator new(size_t size)
{
    return kernel::kmalloc(size);
}

void *operator new[](size_t size)
{
    return kernel::kmalloc(size);
}

void *operator new(size_t size, std::align_val_t align)
{
    return kernel::kmalloc(size, align);
}

void *operator new[](size_t size, std::align_val_t align)
{
    return kernel::kmalloc(size, align);
}

void operator delete(void *p) noexcept
{
    kernel::kfree(p);
}

void operator delete[](void *p) noexcept
{
    kernel::kfree(p);
}

void operator delete(void *p, size_t) noexcept
{
    kernel::kfree(p);
}

void operator delete(void *p, std::align_val_t) noexcept
{
    kernel::kfree(p);
}
#endif
