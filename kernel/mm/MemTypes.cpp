//
// MemTypes.cpp
//

#include <mem/MemTypes.h>

namespace kernel::mm{
    size_t virt_memory_range::getSize() const {
        return this -> end.value - this -> start.value;
    }

    bool virt_memory_range::contains(const virt_addr addr) const {
        return (addr.value >= this -> start.value) && (addr.value < this -> end.value);
    }
}
