#pragma once

#include <kiln/error.hpp>
#include <variant>
#include <functional>

namespace kiln {

template<typename T>
class Result {
    std::variant<T, KilnError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from KilnError so KILN_TRY can return errors across Result<T> types
    Result(KilnError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(KilnError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<KilnError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    KilnError& error() & { return std::get<KilnError>(data_); }
    const KilnError& error() const& { return std::get<KilnError>(data_); }
    KilnError&& error() && { return std::get<KilnError>(std::move(data_)); }

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

    // Transform the error in place (e.g. tag it with a stage name)
    template<typename F>
    Result& map_error(F&& f) {
        if (is_err()) f(error());
        return *this;
    }

    T value_or(T fallback) const {
        if (is_ok()) return value();
        return fallback;
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define KILN_TRY(expr) \
    do { \
        auto _kiln_result = (expr); \
        if (_kiln_result.is_err()) return std::move(_kiln_result).error(); \
    } while(0)

// Like KILN_TRY, but records the pipeline stage on the way out
#define KILN_TRY_AT(expr, stage_name) \
    do { \
        auto _kiln_result = (expr); \
        if (_kiln_result.is_err()) { \
            auto _kiln_err = std::move(_kiln_result).error(); \
            _kiln_err.at_stage(stage_name); \
            return _kiln_err; \
        } \
    } while(0)

} // namespace kiln
