//
// LinuxError.h - errno values as they cross the Linux syscall ABI
//

#ifndef HERONOS_LINUXERROR_H
#define HERONOS_LINUXERROR_H

#include <stdint.h>
#include <core/PrintStream.h>

namespace kernel::syscall{
    //Members drop the leading E of the errno name so they cannot collide with <errno.h> macros
    enum class LinuxError : int32_t{
        PERM = 1,
        NOENT = 2,
        SRCH = 3,
        INTR = 4,
        IO = 5,
        NXIO = 6,
        TOOBIG = 7,
        NOEXEC = 8,
        BADF = 9,
        CHILD = 10,
        AGAIN = 11,
        NOMEM = 12,
        ACCES = 13,
        FAULT = 14,
        NOTBLK = 15,
        BUSY = 16,
        EXIST = 17,
        XDEV = 18,
        NODEV = 19,
        NOTDIR = 20,
        ISDIR = 21,
        INVAL = 22,
        NFILE = 23,
        MFILE = 24,
        NOTTY = 25,
        TXTBSY = 26,
        FBIG = 27,
        NOSPC = 28,
        SPIPE = 29,
        ROFS = 30,
        MLINK = 31,
        PIPE = 32,
        DOM = 33,
        RANGE = 34,
        DEADLK = 35,
        NAMETOOLONG = 36,
        NOLCK = 37,
        NOSYS = 38,
        NOTEMPTY = 39,
        LOOP = 40
    };

    constexpr int32_t code(LinuxError error){
        return static_cast<int32_t>(error);
    }

    const char* name(LinuxError error);
}

Core::PrintStream& operator<<(Core::PrintStream& ps, kernel::syscall::LinuxError error);

#endif //HERONOS_LINUXERROR_H
