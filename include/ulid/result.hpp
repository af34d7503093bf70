#pragma once

#include <ulid/error.hpp>
#include <variant>
#include <functional>

namespace ulid {

template<typename T>
class Result {
    std::variant<T, UlidError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from UlidError so ULID_TRY can return errors across Result<T> types
    Result(UlidError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(UlidError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<UlidError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    UlidError& error() & { return std::get<UlidError>(data_); }
    const UlidError& error() const& { return std::get<UlidError>(data_); }
    UlidError&& error() && { return std::get<UlidError>(std::move(data_)); }

    T value_or(T fallback) const& {
        return is_ok() ? std::get<T>(data_) : std::move(fallback);
    }

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
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define ULID_TRY(expr) \
    do { \
        auto _ulid_result = (expr); \
        if (_ulid_result.is_err()) return std::move(_ulid_result).error(); \
    } while(0)

} // namespace ulid
