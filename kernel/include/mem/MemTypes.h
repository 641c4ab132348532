//
// MemTypes.h - address and permission types shared by the memory subsystem
//

#ifndef HERONOS_MEMTYPES_H
#define HERONOS_MEMTYPES_H

#include <stdint.h>
#include <stddef.h>
#include <core/PrintStream.h>
#include <core/Flags.h>
#include <core/math.h>

namespace kernel::mm{
    struct virt_addr {
        uint64_t value;
        constexpr explicit virt_addr(uint64_t v) : value(v) {}
        constexpr explicit virt_addr() : value(0) {}
        explicit virt_addr(void* v) : value((uint64_t)v) {}
        virt_addr operator+(const size_t offset) const {return virt_addr(value + offset);}
        virt_addr operator-(const size_t offset) const {return virt_addr(value - offset);}
        virt_addr& operator+=(const size_t offset) {value += offset; return *this;}
        virt_addr& operator-=(const size_t offset) {value -= offset; return *this;}
        bool operator==(const virt_addr & other) const {return value == other.value;}
        bool operator<(const virt_addr & other) const {return value < other.value;}
        bool operator<=(const virt_addr & other) const {return value <= other.value;}
        [[nodiscard]] constexpr bool isAligned(size_t alignment) const {return ::isAligned(value, alignment);}
    };

    //Half-open range [start, end)
    struct virt_memory_range {
        virt_addr start;
        virt_addr end;

        static virt_memory_range fromStartSize(virt_addr start, size_t size) {
            return {start, start + size};
        }

        [[nodiscard]] size_t getSize() const;
        [[nodiscard]] bool contains(virt_addr) const;
    };

    enum class PageMappingPermissions : uint8_t {
        READ  = 1 << 0,
        WRITE = 1 << 1,
        EXEC  = 1 << 2,
        USER  = 1 << 3
    };
}

template<>
struct FlagTraits<kernel::mm::PageMappingPermissions> {
    static constexpr uint8_t allBits = 0xf;
};

namespace kernel::mm{
    using MappingFlags = Flags<PageMappingPermissions>;
}

inline Core::PrintStream& operator<<(Core::PrintStream& ps, kernel::mm::virt_addr vaddr){
    return ps << "virt_addr(" << (void*)vaddr.value << ")";
}

inline Core::PrintStream& operator<<(Core::PrintStream& ps, kernel::mm::MappingFlags flags){
    using kernel::mm::PageMappingPermissions;
    ps << (flags.contains(PageMappingPermissions::USER) ? 'U' : '-');
    ps << (flags.contains(PageMappingPermissions::READ) ? 'R' : '-');
    ps << (flags.contains(PageMappingPermissions::WRITE) ? 'W' : '-');
    return ps << (flags.contains(PageMappingPermissions::EXEC) ? 'X' : '-');
}

#endif //HERONOS_MEMTYPES_H
