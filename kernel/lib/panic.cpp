//
// panic.cpp
//

#include <panic.h>
#include <core/CoreAssert.h>

namespace Core{
    void assertionFailure(const char* file, const int line, const char* message){
        kernel::panic(file, static_cast<uint32_t>(line), "Assert failed: ", message);
    }
}
