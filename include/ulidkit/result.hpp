#pragma once

#include <ulidkit/error.hpp>
#include <utility>
#include <variant>

namespace ulidkit {

// Either a value or an UlidError. Every fallible codec and generator
// operation returns one of these; nothing in the library throws.
template<typename T>
class Result {
    std::variant<T, UlidError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from UlidError so ULIDKIT_TRY can return errors across Result<T> types
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
    auto map(F&& f) const -> Result<decltype(f(std::declval<const T&>()))> {
        using U = decltype(f(std::declval<const T&>()));
        if (is_ok()) {
            return Result<U>::ok(f(value()));
        }
        return Result<U>::err(error());
    }

    template<typename F>
    auto and_then(F&& f) const -> decltype(f(std::declval<const T&>())) {
        if (is_ok()) {
            return f(value());
        }
        using RetType = decltype(f(std::declval<const T&>()));
        return RetType::err(error());
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define ULIDKIT_TRY(expr) \
    do { \
        auto _ulidkit_result = (expr); \
        if (_ulidkit_result.is_err()) return std::move(_ulidkit_result).error(); \
    } while(0)

#define ULIDKIT_CONCAT_INNER(a, b) a##b
#define ULIDKIT_CONCAT(a, b) ULIDKIT_CONCAT_INNER(a, b)

// Declares `decl` from the value of `expr`, or returns its error.
//   ULIDKIT_TRY_ASSIGN(auto time, decode_time(field));
#define ULIDKIT_TRY_ASSIGN(decl, expr) \
    ULIDKIT_TRY_ASSIGN_IMPL(ULIDKIT_CONCAT(_ulidkit_tmp_, __LINE__), decl, expr)

#define ULIDKIT_TRY_ASSIGN_IMPL(tmp, decl, expr) \
    auto tmp = (expr); \
    if (tmp.is_err()) return std::move(tmp).error(); \
    decl = std::move(tmp).value()

} // namespace ulidkit
