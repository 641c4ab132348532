//
// syscall.h - Linux syscall entry and the helper every handler goes through
//

#ifndef HERONOS_SYSCALL_H
#define HERONOS_SYSCALL_H

#include <stdint.h>
#include <kernel.h>
#include <core/utility.h>
#include <core/ds/Result.h>
#include <mem/MemTypes.h>
#include <syscall/LinuxError.h>

namespace kernel::syscall{
    enum class SyscallNumber : uint64_t{
        IOCTL = 29,
        OPENAT = 56,
        CLOSE = 57,
        READ = 63,
        WRITE = 64,
        WRITEV = 66,
        EXIT = 93,
        EXIT_GROUP = 94,
        SET_TID_ADDRESS = 96,
        MMAP = 222
    };

    //What the trap entry hands over: the syscall number and the six argument registers
    struct SyscallFrame{
        uint64_t number;
        uint64_t args[6];
    };

    //Returns the payload, or -errno on failure
    int64_t handleSyscall(const SyscallFrame& frame);

    template <typename T>
    int64_t toSyscallReturn(T value){
        return static_cast<int64_t>(value);
    }

    inline int64_t toSyscallReturn(mm::virt_addr address){
        return static_cast<int64_t>(address.value);
    }

    //Runs body, which returns a Result<T, LinuxError>, logs the outcome under name and converts it
    //to the ABI return convention. EAGAIN is routine and only logged at debug importance.
    template <typename Body>
    int64_t syscallBody(const char* name, Body&& body){
        auto result = body();
        using ValueType = typename decltype(result)::value_type;
        if (result.ok()) {
            int64_t ret = 0;
            if constexpr (!is_void_v<ValueType>) {
                ret = toSyscallReturn(*result);
            }
            log(LoggingImportance::DEBUG) << name << " => " << ret << "\n";
            return ret;
        }
        const LinuxError error = result.error();
        const auto importance = (error == LinuxError::AGAIN) ? LoggingImportance::DEBUG : LoggingImportance::IMPORTANT;
        log(importance) << name << " => Err(" << error << ")\n";
        return -static_cast<int64_t>(code(error));
    }
}

#endif //HERONOS_SYSCALL_H
