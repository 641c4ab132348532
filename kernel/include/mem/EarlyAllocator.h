//
// EarlyAllocator.h - boot-time allocator for one contiguous extent
//
// The extent [start, start + size) is split in two zones that grow toward each other:
//
//   start                bytePos              pagePos            start + size
//     |---- byte zone ---->|        free        |<---- page zone ----|
//
// The byte zone hands out small allocations and is only reclaimed as a whole, once every
// byte allocation has been freed. The page zone hands out whole pages and reclaims them
// most-recent-first. start <= bytePos <= pagePos <= start + size holds after every call.
//

#ifndef HERONOS_EARLYALLOCATOR_H
#define HERONOS_EARLYALLOCATOR_H

#include <stddef.h>
#include <stdint.h>
#include <core/math.h>
#include <core/ds/Result.h>
#include <mem/MemTypes.h>

namespace kernel::mm{
    enum class AllocError : uint8_t{
        NO_MEMORY
    };

    template <size_t PageSize>
    class EarlyAllocator{
        static_assert(isPowerOfTwo(PageSize), "Page size must be a power of two");
    private:
        uintptr_t start;
        size_t size;
        uintptr_t bytePos;
        uintptr_t pagePos;
        size_t count;

        [[nodiscard]] uintptr_t ceiling() const {return start + size;}
    public:
        constexpr EarlyAllocator() : start(0), size(0), bytePos(0), pagePos(0), count(0) {}

        //Discards all previous state
        void init(virt_addr regionStart, size_t regionSize);

        //Moves the page boundary to regionStart + regionSize. The boundary may never pass the
        //end of the extent given to init, nor drop below the byte cursor.
        Result<void, AllocError> addMemory(virt_addr regionStart, size_t regionSize);

        //align must be a power of two
        Result<void*, AllocError> alloc(size_t bytes, size_t align);
        //Only the number of live allocations matters, not which one is freed
        void dealloc(void* ptr, size_t bytes, size_t align);

        Result<virt_addr, AllocError> allocPages(size_t pageCount, size_t alignPow2);
        //Reclaims only the block sitting at the page boundary; anything else is ignored
        void deallocPages(virt_addr pos, size_t pageCount);

        [[nodiscard]] size_t totalBytes() const;
        [[nodiscard]] size_t usedBytes() const;
        [[nodiscard]] size_t availableBytes() const;
        [[nodiscard]] size_t totalPages() const;
        [[nodiscard]] size_t usedPages() const;
        [[nodiscard]] size_t availablePages() const;

        [[nodiscard]] virt_addr bytePosition() const {return virt_addr(bytePos);}
        [[nodiscard]] virt_addr pagePosition() const {return virt_addr(pagePos);}
        [[nodiscard]] size_t liveAllocations() const {return count;}
        [[nodiscard]] bool owns(const void* ptr) const;
    };
}

#endif //HERONOS_EARLYALLOCATOR_H
