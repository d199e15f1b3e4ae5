#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the authentication core.

#include <cstdint>
#include <string_view>

namespace warden::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    AlreadyExists = 0x0002,

    // Credential (0x0100 - 0x01FF)
    CryptoFailure = 0x0100,
    InvalidCredentials = 0x0101,
    InvalidUsername = 0x0102,
    InvalidEmail = 0x0103,
    WeakPassword = 0x0104,

    // Token (0x0200 - 0x02FF)
    TokenLifetimeOutOfRange = 0x0200,

    // Directory (0x0300 - 0x03FF)
    DirectoryUnavailable = 0x0300,
    AccountNotFound = 0x0301,
    AlreadyConfirmed = 0x0302,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    ConfigInvalidValue = 0x0603,

    // Logger (0x0800 - 0x08FF)
    LoggerFlushFailed = 0x0800,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Credential";
        case 0x0200: return "Token";
        case 0x0300: return "Directory";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

} // namespace warden::foundation
