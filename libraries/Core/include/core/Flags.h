//
// Flags.h - type-safe bit sets over an enum class
//
// Each flag enum must specialize FlagTraits with the mask of every bit it
// defines, so that raw values coming from outside (user registers, on-disk
// fields) can be checked for bits nobody knows about.
//

#ifndef HERONOS_FLAGS_H
#define HERONOS_FLAGS_H

#include <core/utility.h>
#include <core/ds/Optional.h>

template<typename Enum>
struct FlagTraits;

template<typename Enum>
concept FlagEnum = requires {
    { FlagTraits<Enum>::allBits } -> convertible_to<underlying_type_t<Enum>>;
};

template<typename Enum>
requires FlagEnum<Enum>
class Flags {
public:
    using Bits = underlying_type_t<Enum>;

private:
    Bits bits;

    constexpr explicit Flags(Bits b) : bits(b) {}

public:
    constexpr Flags() : bits(0) {}
    constexpr Flags(Enum e) : bits(static_cast<Bits>(e)) {}

    //Rejects raw values carrying bits outside FlagTraits<Enum>::allBits
    static Optional<Flags> fromBits(Bits raw) {
        if ((raw & ~static_cast<Bits>(FlagTraits<Enum>::allBits)) != 0) {
            return {};
        }
        return Flags(raw);
    }

    //Silently drops unknown bits
    static constexpr Flags fromBitsTruncate(Bits raw) {
        return Flags(static_cast<Bits>(raw & static_cast<Bits>(FlagTraits<Enum>::allBits)));
    }

    static constexpr Flags all() {
        return Flags(static_cast<Bits>(FlagTraits<Enum>::allBits));
    }

    [[nodiscard]] constexpr Bits raw() const { return bits; }
    [[nodiscard]] constexpr bool empty() const { return bits == 0; }

    [[nodiscard]] constexpr bool contains(Flags other) const {
        return (bits & other.bits) == other.bits;
    }

    [[nodiscard]] constexpr bool intersects(Flags other) const {
        return (bits & other.bits) != 0;
    }

    constexpr Flags operator|(Flags other) const { return Flags(static_cast<Bits>(bits | other.bits)); }
    constexpr Flags operator&(Flags other) const { return Flags(static_cast<Bits>(bits & other.bits)); }
    constexpr Flags without(Flags other) const { return Flags(static_cast<Bits>(bits & ~other.bits)); }

    constexpr Flags& operator|=(Flags other) {
        bits = static_cast<Bits>(bits | other.bits);
        return *this;
    }

    constexpr Flags& operator&=(Flags other) {
        bits = static_cast<Bits>(bits & other.bits);
        return *this;
    }

    constexpr bool operator==(const Flags& other) const = default;
};

template<typename Enum>
requires FlagEnum<Enum>
constexpr Flags<Enum> operator|(Enum a, Enum b) {
    return Flags<Enum>(a) | Flags<Enum>(b);
}

#endif //HERONOS_FLAGS_H
