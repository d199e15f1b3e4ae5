/// @file input_validator.cpp
/// @brief InputValidator implementation.

#include "warden/service/input_validator.hpp"

#include <cctype>

namespace warden::service {

namespace {

bool isAlpha(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

bool isAlnum(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

// RFC 5322 atext specials.
bool isLocalSpecialChar(char c) {
    constexpr std::string_view specials = "!#$%&'*+/=?^_`{|}~-.";
    return specials.find(c) != std::string_view::npos;
}

}  // anonymous namespace

ValidationResult InputValidator::validateUsername(std::string_view username) {
    if (username.empty()) {
        return ValidationResult::fail("username must not be empty");
    }
    if (username.size() > kMaxUsernameLength) {
        return ValidationResult::fail("username must not exceed " +
                                      std::to_string(kMaxUsernameLength) + " characters");
    }
    if (!isAlpha(username.front())) {
        return ValidationResult::fail("username must start with a letter");
    }
    for (char c : username) {
        if (!isAlnum(c) && c != '_' && c != '.') {
            return ValidationResult::fail(
                "username must contain only letters, numbers, dots or underscores");
        }
    }
    return ValidationResult::ok();
}

ValidationResult InputValidator::validateEmail(std::string_view email) {
    if (email.empty()) {
        return ValidationResult::fail("email must not be empty");
    }
    if (email.size() > kMaxEmailLength) {
        return ValidationResult::fail("email exceeds maximum length");
    }

    auto atPos = email.find('@');
    if (atPos == std::string_view::npos || atPos == 0 ||
        email.find('@', atPos + 1) != std::string_view::npos) {
        return ValidationResult::fail("email must contain exactly one '@'");
    }

    auto local = email.substr(0, atPos);
    auto domain = email.substr(atPos + 1);

    if (local.size() > kMaxLocalPartLength) {
        return ValidationResult::fail("email local part exceeds 64 characters");
    }
    if (local.front() == '.' || local.back() == '.' ||
        local.find("..") != std::string_view::npos) {
        return ValidationResult::fail("email local part has misplaced dots");
    }
    for (char c : local) {
        if (!isAlnum(c) && !isLocalSpecialChar(c)) {
            return ValidationResult::fail("email local part contains invalid character");
        }
    }

    if (domain.empty() || domain.find('.') == std::string_view::npos) {
        return ValidationResult::fail("email domain must have at least one dot");
    }
    std::size_t labelStart = 0;
    while (labelStart <= domain.size()) {
        auto dotPos = domain.find('.', labelStart);
        auto labelEnd = (dotPos == std::string_view::npos) ? domain.size() : dotPos;
        auto label = domain.substr(labelStart, labelEnd - labelStart);
        if (label.empty() || label.front() == '-' || label.back() == '-') {
            return ValidationResult::fail("email domain label is invalid");
        }
        for (char c : label) {
            if (!isAlnum(c) && c != '-') {
                return ValidationResult::fail("email domain contains invalid character");
            }
        }
        if (dotPos == std::string_view::npos) {
            break;
        }
        labelStart = labelEnd + 1;
    }
    return ValidationResult::ok();
}

ValidationResult InputValidator::validatePassword(std::string_view password,
                                                  uint32_t minLength) {
    if (password.size() < static_cast<std::size_t>(minLength)) {
        return ValidationResult::fail("password must be at least " + std::to_string(minLength) +
                                      " characters");
    }
    if (password.size() > kMaxPasswordLength) {
        return ValidationResult::fail("password must not exceed " +
                                      std::to_string(kMaxPasswordLength) + " characters");
    }

    bool hasLetter = false;
    bool hasDigit = false;
    for (char c : password) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalpha(uc)) {
            hasLetter = true;
        } else if (std::isdigit(uc)) {
            hasDigit = true;
        }
    }
    if (!hasLetter || !hasDigit) {
        return ValidationResult::fail("password must contain both letters and digits");
    }
    return ValidationResult::ok();
}

}  // namespace warden::service
