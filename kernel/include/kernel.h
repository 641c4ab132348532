//
// kernel.h - kernel-wide logging and heap entry points
//

#ifndef HERONOS_KERNEL_H
#define HERONOS_KERNEL_H

#include <core/PrintStream.h>
#include <stddef.h>
#include <stdint.h>
#include <new>
#include <core/utility.h>

namespace kernel{
    enum class LoggingImportance : uint8_t{
        DEBUG = 0,
        IMPORTANT = 1,
        CRITICAL = 2,
        ERROR = 3
    };

    extern Core::PrintStream& klog;

    //Returns klog when importance reaches the current threshold, a discarding stream otherwise
    Core::PrintStream& log(LoggingImportance importance);
    void setLogThreshold(LoggingImportance threshold);
    LoggingImportance logThreshold();

    //Unfiltered, for use when the system is going down
    Core::PrintStream& emergencyLog();

    void* kmalloc(size_t size, std::align_val_t = std::align_val_t{1});
    void kfree(void* ptr);
}

#endif //HERONOS_KERNEL_H
