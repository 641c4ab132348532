//
// panic.h
//

#ifndef HERONOS_PANIC_H
#define HERONOS_PANIC_H

#include <kernel.h>
#include <arch.h>

#define PANIC(...) kernel::panic(__FILE__, __LINE__, __VA_ARGS__)

namespace kernel{
    template <typename... Args>
    [[noreturn]]
    void panic(const char* filename, const uint32_t line, Args&&... args){
        emergencyLog() << "Panic: ";
        (emergencyLog() << ... << forward<Args>(args));
        emergencyLog() << "\nIn file " << filename << " line " << line << "\n";
        arch::halt();
    }
}

#endif //HERONOS_PANIC_H
