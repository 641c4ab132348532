//
// init.h - ordered boot components
//

#ifndef HERONOS_INIT_H
#define HERONOS_INIT_H

#include <stddef.h>
#include <stdint.h>
#include <kernel.h>
#include <mem/EarlyMemory.h>

namespace kernel::init{
    //Everything the boot components share. Owned by whoever drives boot.
    struct BootContext{
        mm::EarlyMemory& earlyMemory;
    };

    using ComponentFlag = uint8_t;
    using Initializer = bool (*)(BootContext&);

    constexpr ComponentFlag CF_NONE = 0;
    constexpr ComponentFlag CF_REQUIRED = 1;
    constexpr ComponentFlag CF_PHASE_MARKER = 4;

    struct InitComponent{
        const char* name;
        Initializer initializer;
        ComponentFlag flags;
        LoggingImportance logging_importance;

        bool operator==(const InitComponent& other) const {
            return (name == other.name) && (initializer == other.initializer) &&
                (flags == other.flags) && (logging_importance == other.logging_importance);
        }
    };

    const InitComponent END_SENTINEL = {nullptr, nullptr, CF_NONE, LoggingImportance::DEBUG};

    //The kernel's own boot sequence, terminated by END_SENTINEL
    extern const InitComponent bootComponents[];

    //Runs components in order until END_SENTINEL. A failing CF_REQUIRED component panics.
    //Returns how many optional components failed.
    size_t kinit(const InitComponent* components, BootContext& context, LoggingImportance minimalComponentImportance);
}

#endif //HERONOS_INIT_H
