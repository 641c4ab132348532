//
// PrintStream.cpp
//

#include <stddef.h>
#include <core/PrintStream.h>
#include <lib/str.h>

namespace Core{
    namespace {
        //Enough room for every decimal digit of T, a sign and the terminator
        template <typename T>
        constexpr size_t decimalBufferSize = sizeof(T) * 3 + 2;

        template <typename T>
        PrintStream& printDecimal(PrintStream& ps, const T value){
            char digitsOut[decimalBufferSize<T>];
            itoa(value, digitsOut, 10);
            return ps << static_cast<const char*>(digitsOut);
        }
    }

    PrintStream& PrintStream::operator<<(const char c){
        const char str[2] = {c, 0};
        putString(str);
        return *this;
    }

    PrintStream& PrintStream::operator<<(const char* str){
        putString(str == nullptr ? "(null)" : str);
        return *this;
    }

    //Pointers always print as 16 zero-padded hex digits
    PrintStream& PrintStream::operator<<(const void* ptr){
        char hex[sizeof(uint64_t) * 2 + 1];
        paddedItoa(reinterpret_cast<uint64_t>(ptr), hex, 16, sizeof(uint64_t) * 2);
        putString("0x");
        putString(hex);
        return *this;
    }

    PrintStream& PrintStream::operator<<(const uint8_t x){ return printDecimal(*this, x); }
    PrintStream& PrintStream::operator<<(const uint16_t x){ return printDecimal(*this, x); }
    PrintStream& PrintStream::operator<<(const uint32_t x){ return printDecimal(*this, x); }
    PrintStream& PrintStream::operator<<(const uint64_t x){ return printDecimal(*this, x); }
    PrintStream& PrintStream::operator<<(const int16_t x){ return printDecimal(*this, x); }
    PrintStream& PrintStream::operator<<(const int32_t x){ return printDecimal(*this, x); }
    PrintStream& PrintStream::operator<<(const int64_t x){ return printDecimal(*this, x); }

    PrintStream& PrintStream::operator<<(const bool x){
        putString(x ? "true" : "false");
        return *this;
    }
}
