#pragma once

/// @file warden_error.hpp
/// @brief Error type used with Result<T, WardenError>.

#include <string>
#include <string_view>
#include <utility>

#include "warden/foundation/error_code.hpp"

namespace warden::foundation {

/// Error carrying a categorized code and a human-readable message.
///
/// Messages are meant for logs and operators. Anything shown to an end user
/// goes through the outcome types' userMessage() instead.
class WardenError {
public:
    WardenError() = default;

    explicit WardenError(ErrorCode code)
        : code_(code) {}

    WardenError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// The categorized error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// Human-readable error description.
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Check if this represents a success (no error).
    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
};

} // namespace warden::foundation
