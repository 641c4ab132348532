//
// AddressSpace.h - the per-task virtual memory object the syscall layer maps into
//

#ifndef HERONOS_ADDRESSSPACE_H
#define HERONOS_ADDRESSSPACE_H

#include <stddef.h>
#include <core/atomic.h>
#include <core/ds/Optional.h>
#include <core/ds/Result.h>
#include <mem/MemTypes.h>

namespace kernel::mm{
    enum class AddressSpaceError : uint8_t{
        NO_MEMORY,
        INVALID_INPUT,
        ALREADY_EXISTS,
        BAD_STATE,
        BAD_ADDRESS,
        UNSUPPORTED
    };

    //Page tables and region bookkeeping are left to the implementation. Callers hold the
    //lock (acquire/release, usually through LockGuard) across every call below.
    class AddressSpace{
        Spinlock lock;
    public:
        virtual ~AddressSpace() = default;

        void acquire() {lock.acquire();}
        void release() {lock.release();}
        [[nodiscard]] bool locked() const {return lock.held();}

        [[nodiscard]] virtual virt_addr base() const = 0;
        [[nodiscard]] virtual size_t size() const = 0;

        //Finds length free bytes inside limit, preferring an area at or after hint
        virtual Optional<virt_addr> findFreeArea(virt_addr hint, size_t length, virt_memory_range limit) = 0;
        //Maps length bytes of fresh memory at addr. populate backs every page immediately.
        virtual Result<void, AddressSpaceError> mapAlloc(virt_addr addr, size_t length, MappingFlags flags, bool populate) = 0;
        //Copies into mapped memory, regardless of the mapping's permissions
        virtual Result<void, AddressSpaceError> write(virt_addr addr, const void* data, size_t length) = 0;
    };
}

Core::PrintStream& operator<<(Core::PrintStream& ps, kernel::mm::AddressSpaceError error);

#endif //HERONOS_ADDRESSSPACE_H
