#pragma once

#include "errors.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace retrace::core {

// Reading the wrong side of a Result. A caller bug, never an I/O failure.
class BadResultAccess : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// Value-or-Error return used by every storage and checkpoint operation.
// Failures travel as values; nothing on the public API throws for I/O.
template<typename T, typename E = Error>
class Result {
public:
    Result(const T& value) : data_(std::in_place_index<0>, value) {}
    Result(T&& value) : data_(std::in_place_index<0>, std::move(value)) {}
    Result(const E& error) : data_(std::in_place_index<1>, error) {}
    Result(E&& error) : data_(std::in_place_index<1>, std::move(error)) {}

    static Result ok(T value) {
        return Result(std::move(value));
    }

    static Result err(E error) {
        return Result(std::move(error));
    }

    // err(code), err(code, message), err(code, message, context)
    template<typename... Args>
    static Result err(ErrorCode code, Args&&... args) {
        return Result(E{code, std::forward<Args>(args)...});
    }

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }
    explicit operator bool() const { return is_ok(); }

    T& value() & { require_ok(); return std::get<0>(data_); }
    const T& value() const& { require_ok(); return std::get<0>(data_); }
    T&& value() && { require_ok(); return std::get<0>(std::move(data_)); }

    E& error() & { require_err(); return std::get<1>(data_); }
    const E& error() const& { require_err(); return std::get<1>(data_); }
    E&& error() && { require_err(); return std::get<1>(std::move(data_)); }

    template<typename F>
    auto map(F&& f) const -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_err()) {
            return Result<U, E>::err(std::get<1>(data_));
        }
        return Result<U, E>::ok(f(std::get<0>(data_)));
    }

    template<typename F>
    Result map_err(F&& f) && {
        if (is_ok()) {
            return std::move(*this);
        }
        return Result(f(std::get<1>(data_)));
    }

    // Name the component that surfaced the error; values pass through
    Result with_source(std::string source) && {
        if (is_err()) {
            return Result(std::get<1>(data_).with_source(std::move(source)));
        }
        return std::move(*this);
    }

    T unwrap_or(T fallback) const {
        return is_ok() ? std::get<0>(data_) : std::move(fallback);
    }

private:
    std::variant<T, E> data_;

    void require_ok() const {
        if (is_ok()) return;
        if constexpr (std::is_same_v<E, Error>) {
            throw BadResultAccess("value() on error result: " + std::get<1>(data_).full_message());
        } else {
            throw BadResultAccess("value() on error result");
        }
    }

    void require_err() const {
        if (is_err()) return;
        throw BadResultAccess("error() on ok result");
    }
};

// Operations that only succeed or fail
template<typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(const E& error) : error_(error) {}
    Result(E&& error) : error_(std::move(error)) {}

    static Result ok() {
        return Result();
    }

    static Result err(E error) {
        return Result(std::move(error));
    }

    template<typename... Args>
    static Result err(ErrorCode code, Args&&... args) {
        return Result(E{code, std::forward<Args>(args)...});
    }

    bool is_ok() const { return !error_.has_value(); }
    bool is_err() const { return error_.has_value(); }
    explicit operator bool() const { return is_ok(); }

    E& error() & { require_err(); return *error_; }
    const E& error() const& { require_err(); return *error_; }
    E&& error() && { require_err(); return std::move(*error_); }

    Result with_source(std::string source) && {
        if (is_err()) {
            return Result(error_->with_source(std::move(source)));
        }
        return Result();
    }

private:
    std::optional<E> error_;

    void require_err() const {
        if (!error_) {
            throw BadResultAccess("error() on ok result");
        }
    }
};

// Early return on error for Result<void> expressions; the enclosing function
// may return any Result with the same error type
#define RETRACE_TRY_VOID(expr) \
    do { \
        auto&& _result = (expr); \
        if (_result.is_err()) { \
            return std::move(_result).error(); \
        } \
    } while (0)

}  // namespace retrace::core
