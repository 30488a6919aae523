#pragma once

#include <ferry/error.hpp>
#include <utility>
#include <variant>

namespace ferry {

// Value-or-error return type used across the library. Copyable when T is,
// so a single result can be handed to every caller waiting on a shared
// in-flight fetch.
template<typename T>
class Result {
    std::variant<T, FerryError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from FerryError so FERRY_TRY can forward errors between
    // Result<T> types
    Result(FerryError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(FerryError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<FerryError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    T value_or(T fallback) const& {
        if (is_ok()) return value();
        return fallback;
    }

    FerryError& error() & { return std::get<FerryError>(data_); }
    const FerryError& error() const& { return std::get<FerryError>(data_); }
    FerryError&& error() && { return std::get<FerryError>(std::move(data_)); }

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
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define FERRY_TRY(expr) \
    do { \
        auto _ferry_result = (expr); \
        if (_ferry_result.is_err()) return std::move(_ferry_result).error(); \
    } while(0)

} // namespace ferry
