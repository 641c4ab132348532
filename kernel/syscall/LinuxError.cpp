//
// LinuxError.cpp
//

#include <syscall/LinuxError.h>

namespace kernel::syscall{
    const char* name(const LinuxError error){
        switch (error) {
            case LinuxError::PERM: return "EPERM";
            case LinuxError::NOENT: return "ENOENT";
            case LinuxError::SRCH: return "ESRCH";
            case LinuxError::INTR: return "EINTR";
            case LinuxError::IO: return "EIO";
            case LinuxError::NXIO: return "ENXIO";
            case LinuxError::TOOBIG: return "E2BIG";
            case LinuxError::NOEXEC: return "ENOEXEC";
            case LinuxError::BADF: return "EBADF";
            case LinuxError::CHILD: return "ECHILD";
            case LinuxError::AGAIN: return "EAGAIN";
            case LinuxError::NOMEM: return "ENOMEM";
            case LinuxError::ACCES: return "EACCES";
            case LinuxError::FAULT: return "EFAULT";
            case LinuxError::NOTBLK: return "ENOTBLK";
            case LinuxError::BUSY: return "EBUSY";
            case LinuxError::EXIST: return "EEXIST";
            case LinuxError::XDEV: return "EXDEV";
            case LinuxError::NODEV: return "ENODEV";
            case LinuxError::NOTDIR: return "ENOTDIR";
            case LinuxError::ISDIR: return "EISDIR";
            case LinuxError::INVAL: return "EINVAL";
            case LinuxError::NFILE: return "ENFILE";
            case LinuxError::MFILE: return "EMFILE";
            case LinuxError::NOTTY: return "ENOTTY";
            case LinuxError::TXTBSY: return "ETXTBSY";
            case LinuxError::FBIG: return "EFBIG";
            case LinuxError::NOSPC: return "ENOSPC";
            case LinuxError::SPIPE: return "ESPIPE";
            case LinuxError::ROFS: return "EROFS";
            case LinuxError::MLINK: return "EMLINK";
            case LinuxError::PIPE: return "EPIPE";
            case LinuxError::DOM: return "EDOM";
            case LinuxError::RANGE: return "ERANGE";
            case LinuxError::DEADLK: return "EDEADLK";
            case LinuxError::NAMETOOLONG: return "ENAMETOOLONG";
            case LinuxError::NOLCK: return "ENOLCK";
            case LinuxError::NOSYS: return "ENOSYS";
            case LinuxError::NOTEMPTY: return "ENOTEMPTY";
            case LinuxError::LOOP: return "ELOOP";
        }
        return "E?";
    }
}

Core::PrintStream& operator<<(Core::PrintStream& ps, const kernel::syscall::LinuxError error){
    return ps << kernel::syscall::name(error);
}
