//
// Result.h - a value or an error code
//
// Result<T, E> holds either a T (success) or an E (failure). It converts
// implicitly from both, so a function returning Result<size_t, LinuxError>
// can simply `return LinuxError::EINVAL;` or `return bytesRead;`.
// Result<void, E> only carries the error.
//

#ifndef HERONOS_RESULT_H
#define HERONOS_RESULT_H

#include <new>
#include <core/utility.h>
#include <core/CoreAssert.h>

template<typename T, typename E>
class Result {
    static_assert(!is_same_v<T, E>, "Result value and error types must differ");
public:
    using value_type = T;
    using error_type = E;
private:
    union {
        T val;
        E err;
    };
    bool success;

    void destroy() {
        if (success) {
            val.~T();
        } else {
            err.~E();
        }
    }

public:
    Result(const T& t) : success(true) {
        new(&val) T(t);
    }

    Result(T&& t) : success(true) {
        new(&val) T(move(t));
    }

    Result(const E& e) : success(false) {
        new(&err) E(e);
    }

    Result(const Result& other) : success(other.success) {
        if (success) {
            new(&val) T(other.val);
        } else {
            new(&err) E(other.err);
        }
    }

    Result(Result&& other) : success(other.success) {
        if (success) {
            new(&val) T(move(other.val));
        } else {
            new(&err) E(move(other.err));
        }
    }

    Result& operator=(const Result& other) {
        if (this != &other) {
            destroy();
            success = other.success;
            if (success) {
                new(&val) T(other.val);
            } else {
                new(&err) E(other.err);
            }
        }
        return *this;
    }

    ~Result() {
        destroy();
    }

    [[nodiscard]] bool ok() const { return success; }
    explicit operator bool() const { return success; }

    T& value() {
        core_assert(success, "Tried to take the value of a failed result");
        return val;
    }

    const T& value() const {
        core_assert(success, "Tried to take the value of a failed result");
        return val;
    }

    T& operator*() { return value(); }
    const T& operator*() const { return value(); }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

    [[nodiscard]] E error() const {
        core_assert(!success, "Tried to take the error of a successful result");
        return err;
    }

    T value_or(const T& fallback) const {
        return success ? val : fallback;
    }

    //Converts the error type, leaving a success untouched
    template<typename F>
    auto transform_error(F&& fn) const -> Result<T, decltype(fn(err))> {
        if (success) {
            return val;
        }
        return fn(err);
    }
};

template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;
private:
    E err;
    bool success;

public:
    Result() : err(), success(true) {}
    Result(const E& e) : err(e), success(false) {}

    [[nodiscard]] bool ok() const { return success; }
    explicit operator bool() const { return success; }

    [[nodiscard]] E error() const {
        core_assert(!success, "Tried to take the error of a successful result");
        return err;
    }

    template<typename F>
    auto transform_error(F&& fn) const -> Result<void, decltype(fn(err))> {
        if (success) {
            return {};
        }
        return fn(err);
    }
};

#endif //HERONOS_RESULT_H
