//
// dispatch.cpp - routes a syscall frame to its handler
//

#include <syscall/syscall.h>
#include <syscall/handlers.h>
#include <syscall/mman.h>

namespace kernel::syscall{
    namespace {
        using Handler = int64_t (*)(const SyscallFrame&);

        struct SyscallEntry{
            SyscallNumber number;
            const char* name;
            Handler handler;
        };

        template <typename T>
        T* userPointer(const uint64_t raw){
            return reinterpret_cast<T*>(raw);
        }

        //Arguments declared int or unsigned int in the C prototype only use the low half of the register
        int32_t asInt(const uint64_t raw){
            return static_cast<int32_t>(static_cast<uint32_t>(raw));
        }

        uint32_t asUint(const uint64_t raw){
            return static_cast<uint32_t>(raw);
        }

        const SyscallEntry syscallTable[] = {
            {SyscallNumber::IOCTL, "ioctl", [](const SyscallFrame& f) {
                return syscallBody("ioctl", [&] {
                    return sys_ioctl(asInt(f.args[0]), f.args[1], mm::virt_addr(f.args[2]));
                });
            }},
            {SyscallNumber::OPENAT, "openat", [](const SyscallFrame& f) {
                return syscallBody("openat", [&] {
                    return sys_openat(asInt(f.args[0]), userPointer<const char>(f.args[1]), asUint(f.args[2]), asUint(f.args[3]));
                });
            }},
            {SyscallNumber::CLOSE, "close", [](const SyscallFrame& f) {
                return syscallBody("close", [&] {
                    return sys_close(asInt(f.args[0]));
                });
            }},
            {SyscallNumber::READ, "read", [](const SyscallFrame& f) {
                return syscallBody("read", [&] {
                    return sys_read(asInt(f.args[0]), userPointer<void>(f.args[1]), f.args[2]);
                });
            }},
            {SyscallNumber::WRITE, "write", [](const SyscallFrame& f) {
                return syscallBody("write", [&] {
                    return sys_write(asInt(f.args[0]), userPointer<const void>(f.args[1]), f.args[2]);
                });
            }},
            {SyscallNumber::WRITEV, "writev", [](const SyscallFrame& f) {
                return syscallBody("writev", [&] {
                    return sys_writev(asInt(f.args[0]), userPointer<const fs::IoVec>(f.args[1]), asInt(f.args[2]));
                });
            }},
            {SyscallNumber::EXIT, "exit", [](const SyscallFrame& f) -> int64_t {
                sys_exit(asInt(f.args[0]));
            }},
            {SyscallNumber::EXIT_GROUP, "exit_group", [](const SyscallFrame& f) -> int64_t {
                sys_exit(asInt(f.args[0]));
            }},
            {SyscallNumber::SET_TID_ADDRESS, "set_tid_address", [](const SyscallFrame& f) {
                return syscallBody("set_tid_address", [&] {
                    return sys_set_tid_address(mm::virt_addr(f.args[0]));
                });
            }},
            {SyscallNumber::MMAP, "mmap", [](const SyscallFrame& f) {
                return syscallBody("mmap", [&] {
                    return sys_mmap(mm::virt_addr(f.args[0]), f.args[1], asUint(f.args[2]), asUint(f.args[3]),
                                    asInt(f.args[4]), f.args[5]);
                });
            }},
        };
    }

    int64_t handleSyscall(const SyscallFrame& frame){
        for (const auto& entry : syscallTable) {
            if (static_cast<uint64_t>(entry.number) == frame.number) {
                log(LoggingImportance::DEBUG) << "handle_syscall [" << frame.number << "] " << entry.name << "\n";
                return entry.handler(frame);
            }
        }
        log(LoggingImportance::IMPORTANT) << "Unimplemented syscall: " << frame.number << "\n";
        return -static_cast<int64_t>(code(LinuxError::NOSYS));
    }
}
