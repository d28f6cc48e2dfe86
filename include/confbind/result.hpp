#pragma once

#include <confbind/error.hpp>
#include <variant>
#include <utility>

namespace confbind {

template<typename T>
class Result {
    std::variant<T, BindError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from BindError so CONFBIND_TRY can return errors across Result<T> types
    Result(BindError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(BindError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<BindError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    BindError& error() & { return std::get<BindError>(data_); }
    const BindError& error() const& { return std::get<BindError>(data_); }
    BindError&& error() && { return std::get<BindError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

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

#define CONFBIND_TRY(expr) \
    do { \
        auto _confbind_result = (expr); \
        if (_confbind_result.is_err()) return std::move(_confbind_result).error(); \
    } while(0)

} // namespace confbind
