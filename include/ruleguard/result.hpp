#pragma once

#include <ruleguard/error.hpp>
#include <type_traits>
#include <utility>
#include <variant>

namespace ruleguard {

// Value or RuleguardError. Units, trees and linters are move-only, so every
// accessor and combinator has an rvalue form that moves the value out.
template<typename T>
class Result {
    std::variant<T, RuleguardError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit so a function returning Result<T> can `return err;` directly
    Result(RuleguardError err) : data_(std::move(err)) {}

    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(RuleguardError e) { return Result(std::move(e)); }

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }
    explicit operator bool() const { return is_ok(); }

    T& value() & { return std::get<0>(data_); }
    const T& value() const& { return std::get<0>(data_); }
    T&& value() && { return std::get<0>(std::move(data_)); }

    RuleguardError& error() & { return std::get<1>(data_); }
    const RuleguardError& error() const& { return std::get<1>(data_); }
    RuleguardError&& error() && { return std::get<1>(std::move(data_)); }

    T value_or(T fallback) const& { return is_ok() ? value() : std::move(fallback); }
    T value_or(T fallback) && { return is_ok() ? std::move(*this).value() : std::move(fallback); }

    // Result<U> holding f(value), or this error
    template<typename F>
    auto map(F&& f) & -> Result<std::decay_t<std::invoke_result_t<F, T&>>> {
        using U = std::decay_t<std::invoke_result_t<F, T&>>;
        if (is_err()) return Result<U>::err(error());
        return Result<U>::ok(f(value()));
    }

    template<typename F>
    auto map(F&& f) && -> Result<std::decay_t<std::invoke_result_t<F, T&&>>> {
        using U = std::decay_t<std::invoke_result_t<F, T&&>>;
        if (is_err()) return Result<U>::err(std::move(*this).error());
        return Result<U>::ok(f(std::move(*this).value()));
    }

    // f(value) when f itself may fail
    template<typename F>
    auto and_then(F&& f) & -> std::invoke_result_t<F, T&> {
        using R = std::invoke_result_t<F, T&>;
        if (is_err()) return R::err(error());
        return f(value());
    }

    template<typename F>
    auto and_then(F&& f) && -> std::invoke_result_t<F, T&&> {
        using R = std::invoke_result_t<F, T&&>;
        if (is_err()) return R::err(std::move(*this).error());
        return f(std::move(*this).value());
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

// Return the error of `expr` from the enclosing function
#define RULEGUARD_TRY(expr) \
    do { \
        auto rg_try_result_ = (expr); \
        if (rg_try_result_.is_err()) return std::move(rg_try_result_).error(); \
    } while (0)

// Declare `var` from the value of `expr`, or return its error
#define RULEGUARD_TRY_ASSIGN(var, expr) \
    auto var##_result_ = (expr); \
    if (var##_result_.is_err()) return std::move(var##_result_).error(); \
    auto var = std::move(var##_result_).value()

} // namespace ruleguard
