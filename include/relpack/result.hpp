#pragma once

#include <relpack/error.hpp>
#include <string>
#include <variant>

namespace relpack {

template<typename T>
class Result {
    std::variant<T, RelpackError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from RelpackError so RELPACK_TRY can return errors across Result<T> types
    Result(RelpackError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(RelpackError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<RelpackError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    RelpackError& error() & { return std::get<RelpackError>(data_); }
    const RelpackError& error() const& { return std::get<RelpackError>(data_); }
    RelpackError&& error() && { return std::get<RelpackError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    T value_or(T fallback) const& {
        return is_ok() ? value() : std::move(fallback);
    }

    // Prefix the error message with `ctx`; an ok value passes through.
    Result context(const std::string& ctx) && {
        if (is_err()) return error().with_context(ctx);
        return std::move(*this);
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

// Per-item failure inside a batch operation; siblings keep running.
struct ItemFailure {
    std::string item;
    RelpackError error;
};

#define RELPACK_TRY(expr) \
    do { \
        auto _relpack_result = (expr); \
        if (_relpack_result.is_err()) return std::move(_relpack_result).error(); \
    } while(0)

} // namespace relpack
