//
// mman.h - mmap(2)
//

#ifndef HERONOS_MMAN_H
#define HERONOS_MMAN_H

#include <stddef.h>
#include <stdint.h>
#include <core/Flags.h>
#include <core/ds/Result.h>
#include <fs/FileTable.h>
#include <mem/AddressSpace.h>
#include <mem/MemTypes.h>
#include <syscall/LinuxError.h>

namespace kernel::syscall{
    //PROT_* bits
    enum class MmapProt : uint32_t{
        READ = 1 << 0,
        WRITE = 1 << 1,
        EXEC = 1 << 2
    };

    //MAP_* bits
    enum class MmapFlags : uint32_t{
        SHARED = 0x1,
        PRIVATE = 0x2,
        FIXED = 0x10,
        ANONYMOUS = 0x20,
        NORESERVE = 0x4000,
        STACK = 0x20000
    };
}

template<>
struct FlagTraits<kernel::syscall::MmapProt> {
    static constexpr uint32_t allBits = 0x7;
};

template<>
struct FlagTraits<kernel::syscall::MmapFlags> {
    static constexpr uint32_t allBits = 0x1 | 0x2 | 0x10 | 0x20 | 0x4000 | 0x20000;
};

namespace kernel::syscall{
    //User mappings are always USER. PROT_NONE yields a USER-only mapping nobody can touch.
    mm::MappingFlags toMappingPermissions(Flags<MmapProt> prot);
    LinuxError toLinuxError(mm::AddressSpaceError error);

    //Maps into the current task's address space and returns the start of the mapping
    Result<mm::virt_addr, LinuxError> sys_mmap(mm::virt_addr addr, size_t length, uint32_t prot, uint32_t flags,
                                               fs::Fd fd, uint64_t offset);
}

#endif //HERONOS_MMAN_H
