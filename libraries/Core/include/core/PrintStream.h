//
// PrintStream.h - minimal formatted output stream
//

#ifndef HERONOS_PRINTSTREAM_H
#define HERONOS_PRINTSTREAM_H

#include <stdint.h>

namespace Core{
    class PrintStream{
    protected:
        virtual void putString(const char*) = 0;

    public:
        virtual ~PrintStream() = default;

        PrintStream& operator<<(const char);
        PrintStream& operator<<(const char*);
        PrintStream& operator<<(const void*);
        PrintStream& operator<<(const uint8_t);
        PrintStream& operator<<(const uint16_t);
        PrintStream& operator<<(const uint32_t);
        PrintStream& operator<<(const uint64_t);
        PrintStream& operator<<(const int16_t);
        PrintStream& operator<<(const int32_t);
        PrintStream& operator<<(const int64_t);
        PrintStream& operator<<(const bool);
    };

    // Swallows everything written to it
    class NullPrintStream : public PrintStream{
    protected:
        void putString(const char*) override {}
    };
}

#endif //HERONOS_PRINTSTREAM_H
