//
// boot.cpp - the kernel's boot component table
//

#include <init.h>
#include <arch.h>
#include <kernel.h>
#include <mem/mm.h>

namespace kernel::init{
    namespace {
        constexpr size_t MAX_BOOT_REGIONS = 8;

        bool initEarlyAllocator(BootContext& context) {
            mm::virt_memory_range regions[MAX_BOOT_REGIONS];
            const size_t count = arch::bootMemoryRegions(regions, MAX_BOOT_REGIONS);
            if (count == 0) {
                log(LoggingImportance::ERROR) << "No boot memory regions reported\n";
                return false;
            }
            if (!context.earlyMemory.activate(regions[0])) {
                return false;
            }
            mm::attachEarlyMemory(context.earlyMemory);
            return true;
        }

        //A second boot region, when present, moves the early allocator's page boundary.
        bool initEarlyAllocatorExtension(BootContext& context) {
            mm::virt_memory_range regions[MAX_BOOT_REGIONS];
            const size_t count = arch::bootMemoryRegions(regions, MAX_BOOT_REGIONS);
            if (count < 2) {
                return true;
            }
            return context.earlyMemory.extend(regions[1]);
        }
    }

    const InitComponent bootComponents[] = {
        {"Early memory", nullptr, CF_PHASE_MARKER, LoggingImportance::CRITICAL},
        {"Early allocator", initEarlyAllocator, CF_REQUIRED, LoggingImportance::CRITICAL},
        {"Early allocator extension", initEarlyAllocatorExtension, CF_NONE, LoggingImportance::IMPORTANT},
        END_SENTINEL
    };
}
