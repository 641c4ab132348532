//
// utility.h - move/forward and the small type helpers used across Core
//

#ifndef HERONOS_UTILITY_H
#define HERONOS_UTILITY_H

#include <stddef.h>
#include <stdint.h>

template <typename T, T v>
struct integral_constant {
    static constexpr T value = v;
    using value_type = T;
    using type = integral_constant;
    constexpr operator T() const noexcept { return value; }
};

using true_type = integral_constant<bool, true>;
using false_type = integral_constant<bool, false>;

template <typename T>
struct remove_reference {
    using type = T;
};

template <typename T>
struct remove_reference<T&> {
    using type = T;
};

template <typename T>
struct remove_reference<T&&> {
    using type = T;
};

template <typename T>
using remove_reference_t = typename remove_reference<T>::type;

template <typename T>
struct is_lvalue_reference : false_type {};

template <typename T>
struct is_lvalue_reference<T&> : true_type {};

template <typename T>
constexpr remove_reference_t<T>&& move(T&& t) noexcept {
    return static_cast<remove_reference_t<T>&&>(t);
}

template <typename T>
constexpr T&& forward(remove_reference_t<T>& arg) noexcept {
    return static_cast<T&&>(arg);
}

template <typename T>
constexpr T&& forward(remove_reference_t<T>&& arg) noexcept {
    static_assert(!is_lvalue_reference<T>::value, "bad forward");
    return static_cast<T&&>(arg);
}

template<typename T, typename S>
struct is_same : false_type {};

template<typename T>
struct is_same<T, T> : true_type {};

template<typename T, typename S>
constexpr bool is_same_v = is_same<T, S>::value;

template <typename T>
constexpr bool is_void_v = is_same_v<T, void>;

template<typename T>
using underlying_type_t = __underlying_type(T);

template<typename From, typename To>
concept convertible_to = requires(From f) {
    static_cast<To>(f);
};

#endif //HERONOS_UTILITY_H
