//
// EarlyMemory.h - the boot-owned early allocator and its lifecycle
//

#ifndef HERONOS_EARLYMEMORY_H
#define HERONOS_EARLYMEMORY_H

#include <arch.h>
#include <core/ds/Optional.h>
#include <mem/EarlyAllocator.h>
#include <mem/MemTypes.h>
#include <mem/mm.h>

namespace kernel::mm{
    class EarlyMemory : public HeapBackend{
    public:
        enum class State : uint8_t{
            DORMANT,
            ACTIVE,
            RETIRED
        };

        using Allocator = EarlyAllocator<arch::smallPageSize>;

    private:
        Allocator allocator;
        State state;
        //Highest end of the page zone that may still have blocks handed out. The page cursor
        //sits below it exactly while page blocks are in use.
        virt_addr pageBoundary;

    public:
        constexpr EarlyMemory() : allocator(), state(State::DORMANT), pageBoundary() {}

        EarlyMemory(const EarlyMemory&) = delete;
        EarlyMemory& operator=(const EarlyMemory&) = delete;

        //DORMANT -> ACTIVE. Rejects ranges smaller than EARLY_ALLOC_MIN_REGION_SIZE.
        bool activate(virt_memory_range region);
        //Lets the page zone reach down to region.end, which must lie inside the activated extent.
        //The boundary is not raised while page blocks are outstanding.
        bool extend(virt_memory_range region);
        //ACTIVE -> RETIRED. Outstanding allocations may still be freed afterwards.
        bool retire();

        [[nodiscard]] State getState() const {return state;}
        [[nodiscard]] const Allocator& statistics() const {return allocator;}
        [[nodiscard]] bool owns(const void* ptr) const;

        void* allocate(size_t size, std::align_val_t align) override;
        void free(void* ptr) override;

        Optional<virt_addr> allocatePages(size_t count);
        void freePages(virt_addr pages, size_t count);
    };
}

Core::PrintStream& operator<<(Core::PrintStream& ps, kernel::mm::EarlyMemory::State state);

#endif //HERONOS_EARLYMEMORY_H
