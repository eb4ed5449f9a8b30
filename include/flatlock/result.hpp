#pragma once

#include <flatlock/error.hpp>
#include <variant>
#include <functional>

namespace flatlock {

template<typename T>
class Result {
    std::variant<T, FlatlockError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from FlatlockError so FLATLOCK_TRY can return errors across Result<T> types
    Result(FlatlockError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(FlatlockError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<FlatlockError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    FlatlockError& error() & { return std::get<FlatlockError>(data_); }
    const FlatlockError& error() const& { return std::get<FlatlockError>(data_); }
    FlatlockError&& error() && { return std::get<FlatlockError>(std::move(data_)); }

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

    // Re-tag an error with a different code, keeping message and location.
    Result with_code(FlatlockError::Code code) && {
        if (is_err()) {
            FlatlockError e = std::move(*this).error();
            e.code = code;
            return Result(std::move(e));
        }
        return std::move(*this);
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define FLATLOCK_TRY(expr) \
    do { \
        auto _flatlock_result = (expr); \
        if (_flatlock_result.is_err()) return std::move(_flatlock_result).error(); \
    } while(0)

} // namespace flatlock
