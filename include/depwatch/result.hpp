#pragma once

#include <depwatch/error.hpp>
#include <variant>
#include <utility>

namespace depwatch {

// Value-or-error return type used across the public API. Nothing in depwatch
// throws across a function boundary; callers inspect is_ok()/is_err().
template<typename T>
class Result {
    std::variant<T, DepwatchError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from DepwatchError so DEPWATCH_TRY can return errors across Result<T> types
    Result(DepwatchError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(DepwatchError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<DepwatchError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    // Falls back to `fallback` on error; the error itself is discarded.
    T value_or(T fallback) const& {
        if (is_ok()) return std::get<T>(data_);
        return fallback;
    }

    DepwatchError& error() & { return std::get<DepwatchError>(data_); }
    const DepwatchError& error() const& { return std::get<DepwatchError>(data_); }
    DepwatchError&& error() && { return std::get<DepwatchError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    template<typename F>
    auto map(F&& f) -> Result<decltype(f(std::declval<T&>()))> {
        using U = decltype(f(std::declval<T&>()));
        if (is_ok()) {
            return Result<U>::ok(f(value()));
        }
        return Result<U>::err(error());
    }

    template<typename F>
    auto and_then(F&& f) -> decltype(f(std::declval<T&>())) {
        if (is_ok()) {
            return f(value());
        }
        using RetType = decltype(f(std::declval<T&>()));
        return RetType::err(error());
    }

    template<typename F>
    Result or_else(F&& f) {
        if (is_ok()) {
            return *this;
        }
        return f(error());
    }

    // Replaces the error's code while keeping message, hint and location.
    // Used where a lower layer's IO/Parse failure becomes a ScanFailure.
    Result with_code(DepwatchError::Code code) && {
        if (is_err()) {
            std::get<DepwatchError>(data_).code = code;
        }
        return std::move(*this);
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define DEPWATCH_TRY(expr) \
    do { \
        auto _depwatch_result = (expr); \
        if (_depwatch_result.is_err()) return std::move(_depwatch_result).error(); \
    } while(0)

} // namespace depwatch
