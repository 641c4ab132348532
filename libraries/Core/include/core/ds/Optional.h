//
// Optional.h - a value that may be absent
//

#ifndef HERONOS_OPTIONAL_H
#define HERONOS_OPTIONAL_H

#include <new>
#include <core/utility.h>
#include <core/CoreAssert.h>

template<typename T>
class Optional {
    static_assert(!is_void_v<T>, "Can't make an optional void!");
private:
    union {
        T value;
    };
    bool present;

public:
    static Optional null() {
        return {};
    }

    Optional() : present(false) {}

    Optional(const T& t) : present(true) {
        new(&value) T(t);
    }

    Optional(T&& t) : present(true) {
        new(&value) T(move(t));
    }

    Optional(const Optional& other) : present(other.present) {
        if (present) {
            new(&value) T(other.value);
        }
    }

    Optional(Optional&& other) : present(other.present) {
        if (present) {
            new(&value) T(move(other.value));
        }
    }

    Optional& operator=(const Optional& other) {
        if (this != &other) {
            reset();
            if (other.present) {
                new(&value) T(other.value);
                present = true;
            }
        }
        return *this;
    }

    Optional& operator=(Optional&& other) {
        if (this != &other) {
            reset();
            if (other.present) {
                new(&value) T(move(other.value));
                present = true;
            }
        }
        return *this;
    }

    ~Optional() {
        reset();
    }

    template<typename ... Ts>
    void emplace(Ts&&... ts){
        reset();
        new(&value) T(forward<Ts>(ts)...);
        present = true;
    }

    void reset() {
        if (present) {
            value.~T();
            present = false;
        }
    }

    [[nodiscard]] bool occupied() const {
        return present;
    }

    explicit operator bool() const { return occupied(); }

    T* operator->() {
        core_assert(occupied(), "Tried to dereference empty optional");
        return &value;
    }

    const T* operator->() const {
        core_assert(occupied(), "Tried to dereference empty optional");
        return &value;
    }

    T& operator*(){
        core_assert(occupied(), "Tried to dereference empty optional");
        return value;
    }

    const T& operator*() const{
        core_assert(occupied(), "Tried to dereference empty optional");
        return value;
    }

    T value_or(const T& t) const {
        if (occupied()) {
            return value;
        }
        return t;
    }

    bool operator==(const Optional& other) const {
        if (present != other.present) {
            return false;
        }
        return !present || value == other.value;
    }

    template<typename F>
    auto transform(F&& fn) const & -> Optional<decltype(fn(value))> {
        using OutType = decltype(fn(value));
        if (occupied()) {
            return Optional<OutType>(fn(value));
        }
        return Optional<OutType>();
    }
};

#endif //HERONOS_OPTIONAL_H
