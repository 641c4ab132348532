//
// fs.cpp - file syscalls, passed straight through to the current task's file table
//

#include <kernel.h>
#include <syscall/handlers.h>

namespace kernel::syscall{
    Result<size_t, LinuxError> sys_ioctl(const fs::Fd fd, const uint64_t op, mm::virt_addr){
        log(LoggingImportance::IMPORTANT) << "Ignore SYS_IOCTL (fd " << fd << ", op " << op << ")\n";
        return static_cast<size_t>(0);
    }

    Result<fs::Fd, LinuxError> sys_openat(const fs::Fd dirfd, const char* path, const uint32_t flags, const uint32_t mode){
        //Only paths relative to the working directory (or absolute) are supported
        if (dirfd != fs::CURRENT_DIRECTORY_FD) {
            return LinuxError::INVAL;
        }
        if (path == nullptr) {
            return LinuxError::FAULT;
        }
        return sched::currentTask().files().open(path, flags, mode);
    }

    Result<void, LinuxError> sys_close(const fs::Fd fd){
        return sched::currentTask().files().close(fd);
    }

    Result<size_t, LinuxError> sys_read(const fs::Fd fd, void* buffer, const size_t length){
        return sched::currentTask().files().read(fd, buffer, length);
    }

    Result<size_t, LinuxError> sys_write(const fs::Fd fd, const void* buffer, const size_t length){
        return sched::currentTask().files().write(fd, buffer, length);
    }

    Result<size_t, LinuxError> sys_writev(const fs::Fd fd, const fs::IoVec* vectors, const int32_t count){
        if (count < 0) {
            return LinuxError::INVAL;
        }
        return sched::currentTask().files().writev(fd, vectors, static_cast<size_t>(count));
    }
}
