#pragma once

#include <kspver/error.hpp>
#include <utility>
#include <variant>

namespace kspver {

template<typename T>
class Result {
    std::variant<T, KspVerError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from KspVerError so KSPVER_TRY can return errors across Result<T> types
    Result(KspVerError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(KspVerError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<KspVerError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    KspVerError& error() & { return std::get<KspVerError>(data_); }
    const KspVerError& error() const& { return std::get<KspVerError>(data_); }
    KspVerError&& error() && { return std::get<KspVerError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    // Unwraps the value, throwing VersionException on error
    const T& value_or_throw() const& {
        if (is_err()) throw VersionException(error());
        return value();
    }

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

#define KSPVER_TRY(expr) \
    do { \
        auto _kspver_result = (expr); \
        if (_kspver_result.is_err()) return std::move(_kspver_result).error(); \
    } while(0)

} // namespace kspver
