//
// log.cpp - the kernel log and its importance filter
//

#include <kernel.h>
#include <kconfig.h>
#include <arch.h>
#include <core/atomic.h>

namespace kernel{
    namespace {
        arch::SerialPrintStream serialStream;
        Core::NullPrintStream discardStream;
        Atomic<uint8_t> threshold(static_cast<uint8_t>(KERNEL_DEFAULT_LOG_IMPORTANCE));
    }

    Core::PrintStream& klog = serialStream;

    Core::PrintStream& log(const LoggingImportance importance){
        if (static_cast<uint8_t>(importance) >= threshold.load(RELAXED)) {
            return klog;
        }
        return discardStream;
    }

    void setLogThreshold(const LoggingImportance importance){
        threshold.store(static_cast<uint8_t>(importance), RELAXED);
    }

    LoggingImportance logThreshold(){
        return static_cast<LoggingImportance>(threshold.load(RELAXED));
    }

    Core::PrintStream& emergencyLog(){
        return klog;
    }
}
