#pragma once

#include <moo/error.hpp>
#include <variant>

namespace moo {

template<typename T>
class Result {
    std::variant<T, MooError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from MooError so MOO_TRY can return errors across Result<T> types
    Result(MooError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(MooError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<MooError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    MooError& error() & { return std::get<MooError>(data_); }
    const MooError& error() const& { return std::get<MooError>(data_); }
    MooError&& error() && { return std::get<MooError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define MOO_TRY(expr) \
    do { \
        auto _moo_result = (expr); \
        if (_moo_result.is_err()) return std::move(_moo_result).error(); \
    } while(0)

} // namespace moo
