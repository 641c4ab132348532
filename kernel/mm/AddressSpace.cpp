//
// AddressSpace.cpp
//

#include <mem/AddressSpace.h>

Core::PrintStream& operator<<(Core::PrintStream& ps, const kernel::mm::AddressSpaceError error){
    using kernel::mm::AddressSpaceError;
    switch (error) {
        case AddressSpaceError::NO_MEMORY: return ps << "NoMemory";
        case AddressSpaceError::INVALID_INPUT: return ps << "InvalidInput";
        case AddressSpaceError::ALREADY_EXISTS: return ps << "AlreadyExists";
        case AddressSpaceError::BAD_STATE: return ps << "BadState";
        case AddressSpaceError::BAD_ADDRESS: return ps << "BadAddress";
        case AddressSpaceError::UNSUPPORTED: return ps << "Unsupported";
    }
    return ps;
}
