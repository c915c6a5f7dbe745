#pragma once

#include <fnr/error.hpp>
#include <variant>
#include <utility>

namespace fnr {

template<typename T>
class Result {
    std::variant<T, FnrError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from FnrError so FNR_TRY can return errors across Result<T> types
    Result(FnrError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(FnrError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<FnrError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    FnrError& error() & { return std::get<FnrError>(data_); }
    const FnrError& error() const& { return std::get<FnrError>(data_); }
    FnrError&& error() && { return std::get<FnrError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    // True when this holds an error of the given kind
    bool failed_with(FnrError::Code c) const {
        return is_err() && std::get<FnrError>(data_).code == c;
    }

    T value_or(T fallback) const& {
        if (is_ok()) return std::get<T>(data_);
        return fallback;
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define FNR_TRY(expr) \
    do { \
        auto _fnr_result = (expr); \
        if (_fnr_result.is_err()) return std::move(_fnr_result).error(); \
    } while(0)

} // namespace fnr
