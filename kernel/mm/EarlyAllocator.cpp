//
// EarlyAllocator.cpp
//

#include <mem/EarlyAllocator.h>
#include <arch.h>
#include <kassert.h>

namespace kernel::mm{
    template <size_t PageSize>
    void EarlyAllocator<PageSize>::init(const virt_addr regionStart, const size_t regionSize) {
        uintptr_t end;
        kassert(!__builtin_add_overflow(regionStart.value, regionSize, &end), "Early allocator extent wraps around");
        (void)end;
        start = regionStart.value;
        size = regionSize;
        bytePos = start;
        pagePos = start + size;
        count = 0;
    }

    template <size_t PageSize>
    Result<void, AllocError> EarlyAllocator<PageSize>::addMemory(const virt_addr regionStart, const size_t regionSize) {
        uintptr_t newBoundary;
        if (__builtin_add_overflow(regionStart.value, regionSize, &newBoundary)) {
            return AllocError::NO_MEMORY;
        }
        if (newBoundary > ceiling() || newBoundary < bytePos) {
            return AllocError::NO_MEMORY;
        }
        pagePos = newBoundary;
        return {};
    }

    template <size_t PageSize>
    Result<void*, AllocError> EarlyAllocator<PageSize>::alloc(const size_t bytes, const size_t align) {
        kassert(isPowerOfTwo(align), "Early allocator alignment must be a power of two, got ", align);
        uintptr_t aligned;
        if (!checkedAlignUp(bytePos, align, aligned)) {
            return AllocError::NO_MEMORY;
        }
        uintptr_t end;
        if (__builtin_add_overflow(aligned, bytes, &end) || end > pagePos) {
            return AllocError::NO_MEMORY;
        }
        bytePos = end;
        count++;
        return reinterpret_cast<void*>(aligned);
    }

    template <size_t PageSize>
    void EarlyAllocator<PageSize>::dealloc(void*, size_t, size_t) {
        if (count > 0) {
            count--;
        }
        if (count == 0) {
            bytePos = start;
        }
    }

    template <size_t PageSize>
    Result<virt_addr, AllocError> EarlyAllocator<PageSize>::allocPages(const size_t pageCount, const size_t alignPow2) {
        kassert(isPowerOfTwo(alignPow2), "Page alignment must be a power of two, got ", alignPow2);
        size_t required;
        if (__builtin_mul_overflow(pageCount, PageSize, &required)) {
            return AllocError::NO_MEMORY;
        }
        if (required > pagePos - bytePos) {
            return AllocError::NO_MEMORY;
        }
        const uintptr_t aligned = alignDown(pagePos - required, alignPow2);
        if (aligned < bytePos) {
            return AllocError::NO_MEMORY;
        }
        pagePos = aligned;
        return virt_addr(aligned);
    }

    template <size_t PageSize>
    void EarlyAllocator<PageSize>::deallocPages(const virt_addr pos, const size_t pageCount) {
        if (pos.value != pagePos) {
            return;
        }
        size_t released;
        uintptr_t newBoundary;
        if (__builtin_mul_overflow(pageCount, PageSize, &released) ||
            __builtin_add_overflow(pos.value, released, &newBoundary) ||
            newBoundary > ceiling()) {
            newBoundary = ceiling();
        }
        pagePos = newBoundary;
    }

    template <size_t PageSize>
    size_t EarlyAllocator<PageSize>::totalBytes() const {
        return size;
    }

    template <size_t PageSize>
    size_t EarlyAllocator<PageSize>::usedBytes() const {
        return bytePos - start;
    }

    template <size_t PageSize>
    size_t EarlyAllocator<PageSize>::availableBytes() const {
        return pagePos - bytePos;
    }

    template <size_t PageSize>
    size_t EarlyAllocator<PageSize>::totalPages() const {
        return size / PageSize;
    }

    template <size_t PageSize>
    size_t EarlyAllocator<PageSize>::usedPages() const {
        return (ceiling() - pagePos) / PageSize;
    }

    template <size_t PageSize>
    size_t EarlyAllocator<PageSize>::availablePages() const {
        return (pagePos - bytePos) / PageSize;
    }

    template <size_t PageSize>
    bool EarlyAllocator<PageSize>::owns(const void* ptr) const {
        const auto addr = reinterpret_cast<uintptr_t>(ptr);
        return addr >= start && addr < ceiling();
    }

    template class EarlyAllocator<arch::smallPageSize>;
}
