//
// EarlyMemory.cpp
//

#include <mem/EarlyMemory.h>
#include <kernel.h>
#include <kconfig.h>

namespace kernel::mm{
    bool EarlyMemory::activate(const virt_memory_range region) {
        if (state != State::DORMANT) {
            log(LoggingImportance::ERROR) << "Early memory cannot be activated while " << state << "\n";
            return false;
        }
        if (region.end < region.start || region.getSize() < EARLY_ALLOC_MIN_REGION_SIZE) {
            log(LoggingImportance::ERROR) << "Early memory region [" << region.start << ", " << region.end
                                          << ") is too small\n";
            return false;
        }
        allocator.init(region.start, region.getSize());
        pageBoundary = region.end;
        state = State::ACTIVE;
        log(LoggingImportance::DEBUG) << "Early memory active at [" << region.start << ", " << region.end << "), "
                                      << allocator.totalPages() << " pages\n";
        return true;
    }

    bool EarlyMemory::extend(const virt_memory_range region) {
        if (state != State::ACTIVE) {
            log(LoggingImportance::ERROR) << "Early memory cannot be extended while " << state << "\n";
            return false;
        }
        if (region.end < region.start) {
            return false;
        }
        const virt_addr pageCursor = allocator.pagePosition();
        const bool pagesInUse = pageCursor < pageBoundary;
        if (pagesInUse && pageCursor < region.end) {
            log(LoggingImportance::IMPORTANT) << "Early memory extension to " << region.end
                                              << " would release pages still in use below " << pageBoundary << "\n";
            return false;
        }
        auto res = allocator.addMemory(region.start, region.getSize());
        if (!res) {
            log(LoggingImportance::IMPORTANT) << "Early memory extension to " << region.end
                                              << " lies outside the managed extent\n";
            return false;
        }
        //Blocks above a lowered boundary stay live, so the recorded boundary only drops once they are gone
        if (!pagesInUse || pageBoundary < region.end) {
            pageBoundary = region.end;
        }
        return true;
    }

    bool EarlyMemory::retire() {
        if (state != State::ACTIVE) {
            return false;
        }
        state = State::RETIRED;
        log(LoggingImportance::DEBUG) << "Early memory retired with " << allocator.liveAllocations()
                                      << " live allocations and " << allocator.usedPages() << " pages in use\n";
        return true;
    }

    bool EarlyMemory::owns(const void* ptr) const {
        return state != State::DORMANT && allocator.owns(ptr);
    }

    void* EarlyMemory::allocate(const size_t size, const std::align_val_t align) {
        if (state != State::ACTIVE) {
            return nullptr;
        }
        auto res = allocator.alloc(size, static_cast<size_t>(align));
        if (!res) {
            return nullptr;
        }
        return *res;
    }

    void EarlyMemory::free(void* ptr) {
        if (state == State::DORMANT || ptr == nullptr) {
            return;
        }
        allocator.dealloc(ptr, 0, 1);
    }

    Optional<virt_addr> EarlyMemory::allocatePages(const size_t count) {
        if (state != State::ACTIVE) {
            return {};
        }
        auto res = allocator.allocPages(count, arch::smallPageSize);
        if (!res) {
            return {};
        }
        return *res;
    }

    void EarlyMemory::freePages(const virt_addr pages, const size_t count) {
        if (state == State::DORMANT) {
            return;
        }
        allocator.deallocPages(pages, count);
    }
}

Core::PrintStream& operator<<(Core::PrintStream& ps, const kernel::mm::EarlyMemory::State state){
    using State = kernel::mm::EarlyMemory::State;
    switch (state) {
        case State::DORMANT: return ps << "dormant";
        case State::ACTIVE: return ps << "active";
        case State::RETIRED: return ps << "retired";
    }
    return ps;
}
