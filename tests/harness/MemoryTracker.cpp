//
// Memory tracking instrumentation implementation
//

#include "MemoryTracker.h"
#include <iostream>

namespace HeronOSTest {

    // Static member definitions
    std::unordered_map<void*, AllocationInfo> MemoryTracker::allocations;
    std::mutex MemoryTracker::tracker_mutex;
    size_t MemoryTracker::total_allocated = 0;
    size_t MemoryTracker::total_freed = 0;
    size_t MemoryTracker::peak_usage = 0;
    size_t MemoryTracker::current_usage = 0;

    void MemoryTracker::recordAllocation(void* ptr, size_t size) {
        if (!ptr) return;

        std::lock_guard<std::mutex> lock(tracker_mutex);
        allocations[ptr] = {size};
        total_allocated += size;
        current_usage += size;
        if (current_usage > peak_usage) {
            peak_usage = current_usage;
        }
    }

    bool MemoryTracker::recordDeallocation(void* ptr) {
        if (!ptr) return false;

        std::lock_guard<std::mutex> lock(tracker_mutex);
        auto it = allocations.find(ptr);
        if (it == allocations.end()) {
            return false;
        }
        total_freed += it->second.size;
        current_usage -= it->second.size;
        allocations.erase(it);
        return true;
    }

    bool MemoryTracker::isTracked(void* ptr) {
        std::lock_guard<std::mutex> lock(tracker_mutex);
        return allocations.find(ptr) != allocations.end();
    }

    bool MemoryTracker::hasLeaks() {
        std::lock_guard<std::mutex> lock(tracker_mutex);
        return !allocations.empty();
    }

    void MemoryTracker::printLeakReport() {
        std::lock_guard<std::mutex> lock(tracker_mutex);

        std::cout << "\n=== Memory Leak Report ===" << std::endl;
        std::cout << "Total allocated: " << total_allocated << " bytes" << std::endl;
        std::cout << "Total freed: " << total_freed << " bytes" << std::endl;
        std::cout << "Peak usage: " << peak_usage << " bytes" << std::endl;
        std::cout << "Current usage: " << current_usage << " bytes" << std::endl;
        std::cout << "Active allocations: " << allocations.size() << std::endl;

        if (!allocations.empty()) {
            std::cout << "\nLEAKED ALLOCATIONS:" << std::endl;
            for (const auto& [ptr, info] : allocations) {
                std::cout << "  " << ptr << " -> " << info.size << " bytes" << std::endl;
            }
        } else {
            std::cout << "\nNo memory leaks detected!" << std::endl;
        }
        std::cout << "=========================" << std::endl;
    }

    void MemoryTracker::reset() {
        std::lock_guard<std::mutex> lock(tracker_mutex);
        allocations.clear();
        total_allocated = 0;
        total_freed = 0;
        peak_usage = 0;
        current_usage = 0;
    }
}
