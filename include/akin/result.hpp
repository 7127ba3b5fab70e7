#pragma once

#include <akin/error.hpp>
#include <utility>
#include <variant>

namespace akin {

template<typename T>
class Result {
    std::variant<T, AkinError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from AkinError so AKIN_TRY can return errors across Result<T> types
    Result(AkinError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(AkinError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<AkinError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    AkinError& error() & { return std::get<AkinError>(data_); }
    const AkinError& error() const& { return std::get<AkinError>(data_); }
    AkinError&& error() && { return std::get<AkinError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define AKIN_TRY(expr) \
    do { \
        auto&& _akin_result = (expr); \
        if (_akin_result.is_err()) return std::move(_akin_result).error(); \
    } while(0)

} // namespace akin
