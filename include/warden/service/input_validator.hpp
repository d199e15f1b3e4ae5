#pragma once

/// @file input_validator.hpp
/// @brief Registration input rules: username, email and password strength.

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace warden::service {

/// Result of a validation check.
struct ValidationResult {
    bool valid;
    std::string message;

    explicit operator bool() const noexcept { return valid; }

    static ValidationResult ok() { return {true, {}}; }
    static ValidationResult fail(std::string msg) { return {false, std::move(msg)}; }
};

/// Stateless input validation.  All functions are thread-safe.
class InputValidator {
public:
    static constexpr std::size_t kMaxUsernameLength = 64;
    static constexpr std::size_t kMaxEmailLength = 254;     // RFC 5321
    static constexpr std::size_t kMaxLocalPartLength = 64;  // RFC 5321
    static constexpr std::size_t kMaxPasswordLength = 128;

    /// Usernames start with a letter and contain only letters, digits,
    /// dots and underscores.
    [[nodiscard]] static ValidationResult validateUsername(std::string_view username);

    /// Structural email check: one '@', non-empty local part of atext
    /// characters, dotted domain of alphanumeric/hyphen labels.
    [[nodiscard]] static ValidationResult validateEmail(std::string_view email);

    /// Length bounds plus at least one letter and one digit.
    [[nodiscard]] static ValidationResult validatePassword(std::string_view password,
                                                           uint32_t minLength);
};

}  // namespace warden::service
