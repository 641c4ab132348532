//
// arch.h - hooks each architecture port provides to the portable kernel
//

#ifndef HERONOS_ARCH_H
#define HERONOS_ARCH_H

#include <stdint.h>
#include <stddef.h>
#include <core/PrintStream.h>
#include <mem/MemTypes.h>

namespace arch{
    constexpr size_t smallPageSize = 1ull << 12; //4KiB

    void serialOutputString(const char* str);

    //Stops the machine. The host test build throws instead so tests can observe it.
    [[noreturn]] void halt();

    //Fills out with the usable memory regions reported by the bootloader, already mapped into
    //the kernel's address space. Returns how many regions were written (at most capacity).
    size_t bootMemoryRegions(kernel::mm::virt_memory_range* out, size_t capacity);

    class SerialPrintStream : public Core::PrintStream{
    protected:
        void putString(const char*) override;
    };
}

#endif //HERONOS_ARCH_H
