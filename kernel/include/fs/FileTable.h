//
// FileTable.h - a task's open files, as seen by the syscall layer
//

#ifndef HERONOS_FILETABLE_H
#define HERONOS_FILETABLE_H

#include <stddef.h>
#include <stdint.h>
#include <core/ds/Result.h>
#include <syscall/LinuxError.h>

namespace kernel::fs{
    using syscall::LinuxError;
    using Fd = int32_t;

    //AT_FDCWD
    constexpr Fd CURRENT_DIRECTORY_FD = -100;

    enum class Whence : uint8_t{
        SET = 0,
        CUR = 1,
        END = 2
    };

    //Layout of struct iovec in user memory
    struct IoVec{
        uint64_t base;
        uint64_t length;
    };

    class FileTable{
    public:
        virtual ~FileTable() = default;

        virtual Result<Fd, LinuxError> open(const char* path, uint32_t flags, uint32_t mode) = 0;
        virtual Result<void, LinuxError> close(Fd fd) = 0;
        //A short read is not an error. Zero bytes means end of file.
        virtual Result<size_t, LinuxError> read(Fd fd, void* buffer, size_t length) = 0;
        virtual Result<size_t, LinuxError> write(Fd fd, const void* buffer, size_t length) = 0;
        virtual Result<size_t, LinuxError> writev(Fd fd, const IoVec* vectors, size_t count) = 0;
        //Returns the resulting cursor
        virtual Result<uint64_t, LinuxError> lseek(Fd fd, int64_t offset, Whence whence) = 0;
        [[nodiscard]] virtual bool isOpen(Fd fd) const = 0;
    };
}

#endif //HERONOS_FILETABLE_H
