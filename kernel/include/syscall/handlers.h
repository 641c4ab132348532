//
// handlers.h - syscall implementations, called by the dispatcher with decoded arguments
//

#ifndef HERONOS_HANDLERS_H
#define HERONOS_HANDLERS_H

#include <stddef.h>
#include <stdint.h>
#include <core/ds/Result.h>
#include <fs/FileTable.h>
#include <mem/MemTypes.h>
#include <sched/Task.h>
#include <syscall/LinuxError.h>

namespace kernel::syscall{
    Result<size_t, LinuxError> sys_ioctl(fs::Fd fd, uint64_t op, mm::virt_addr argp);
    Result<fs::Fd, LinuxError> sys_openat(fs::Fd dirfd, const char* path, uint32_t flags, uint32_t mode);
    Result<void, LinuxError> sys_close(fs::Fd fd);
    Result<size_t, LinuxError> sys_read(fs::Fd fd, void* buffer, size_t length);
    Result<size_t, LinuxError> sys_write(fs::Fd fd, const void* buffer, size_t length);
    Result<size_t, LinuxError> sys_writev(fs::Fd fd, const fs::IoVec* vectors, int32_t count);

    Result<sched::TaskId, LinuxError> sys_set_tid_address(mm::virt_addr tidAddress);
    [[noreturn]] void sys_exit(int32_t status);
}

#endif //HERONOS_HANDLERS_H
