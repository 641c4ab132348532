//
// arch.cpp - portable pieces of the architecture layer
//

#include <arch.h>

namespace arch{
    void SerialPrintStream::putString(const char * str){
        serialOutputString(str);
    }
}
