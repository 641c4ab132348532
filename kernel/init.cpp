//
// init.cpp
//

#include <init.h>
#include <kernel.h>
#include <panic.h>

namespace kernel::init {
    bool shouldPrintComponent(const InitComponent& component, LoggingImportance importance) {
        if (importance == LoggingImportance::DEBUG) {
            return true;
        }
        if (component.logging_importance == LoggingImportance::DEBUG) {
            return false;
        }
        return component.logging_importance >= importance;
    }

    bool shouldPrintError(const InitComponent& component, LoggingImportance importance) {
        if (importance == LoggingImportance::DEBUG) {
            return true;
        }
        return component.logging_importance != LoggingImportance::DEBUG;
    }

    size_t kinit(const InitComponent* components, BootContext& context, LoggingImportance minimalComponentImportance) {
        size_t failures = 0;
        for (const InitComponent* component = components; *component != END_SENTINEL; component++) {
            if (component -> flags & CF_PHASE_MARKER) {
                if (shouldPrintComponent(*component, minimalComponentImportance)) {
                    klog << "[Phase] " << component -> name << "\n";
                }
                continue;
            }
            if (shouldPrintComponent(*component, minimalComponentImportance)) {
                klog << "[Boot] " << component -> name << "\n";
            }
            const bool succeeded = component -> initializer(context);
            if (succeeded) {
                continue;
            }
            if (component -> flags & CF_REQUIRED) {
                PANIC("Failed to initialize required component ", component -> name);
            }
            if (shouldPrintError(*component, minimalComponentImportance)) {
                klog << "Failed to initialize " << component -> name << "\n";
            }
            failures++;
        }
        return failures;
    }
}
