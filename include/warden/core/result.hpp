#pragma once

/// @file result.hpp
/// @brief Result<T,E> type for explicit error handling without exceptions.

#include <string>
#include <utility>
#include <variant>

namespace warden {

/// Error information for Result type.
struct Error {
    int code = 0;
    std::string message;

    Error() = default;
    explicit Error(std::string msg) : code(-1), message(std::move(msg)) {}
    Error(int c, std::string msg) : code(c), message(std::move(msg)) {}
};

/// Result type for explicit error propagation.
///
/// Every function that can fail returns Result<T, E> instead of throwing.
/// Expected outcomes (a wrong password, an expired token) are modelled as
/// values of T; E is reserved for faults the caller has to handle.
///
/// @tparam T The success value type.
/// @tparam E The error type (defaults to warden::Error).
///
/// Example:
/// @code
///   auto result = signer.redeem(token);
///   if (result.hasValue()) {
///       auto payload = result.value();
///   } else {
///       log(tokenErrorName(result.error()));
///   }
/// @endcode
template <typename T, typename E = Error>
class Result {
public:
    /// Construct a success result.
    static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }

    /// Construct an error result.
    static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    /// Check if this result holds a value.
    [[nodiscard]] bool hasValue() const noexcept { return data_.index() == 0; }

    /// Check if this result holds an error.
    [[nodiscard]] bool hasError() const noexcept { return data_.index() == 1; }

    /// True if success.
    explicit operator bool() const noexcept { return hasValue(); }

    /// Access the success value (throws std::bad_variant_access if error).
    [[nodiscard]] const T& value() const& { return std::get<0>(data_); }
    [[nodiscard]] T& value() & { return std::get<0>(data_); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(data_)); }

    /// Access the error (throws std::bad_variant_access if success).
    [[nodiscard]] const E& error() const& { return std::get<1>(data_); }
    [[nodiscard]] E& error() & { return std::get<1>(data_); }

    /// Access value or return a default.
    [[nodiscard]] T valueOr(T defaultValue) const& {
        return hasValue() ? value() : std::move(defaultValue);
    }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& v) : data_(tag, std::forward<U>(v)) {}

    std::variant<T, E> data_;
};

/// Specialization for void success type.
template <typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true); }
    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return success_; }
    [[nodiscard]] bool hasError() const noexcept { return !success_; }
    explicit operator bool() const noexcept { return success_; }

    [[nodiscard]] const E& error() const& { return error_; }

private:
    explicit Result(bool) : success_(true) {}
    explicit Result(E error) : success_(false), error_(std::move(error)) {}

    bool success_ = false;
    E error_{};
};

}  // namespace warden
