#pragma once

/// @file auth_types.hpp
/// @brief Core type definitions for the authentication core.
///
/// Defines account records, session records, client context and the
/// configuration consumed by the hasher, token signer and authenticators.

#include "warden/foundation/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warden::service {

using warden::foundation::AccountId;

// -- Account model ------------------------------------------------------------

/// Stored account record.
///
/// The plaintext password is never stored.  passwordHash is the
/// self-describing string produced by CredentialHasher.
struct Account {
    AccountId id;
    std::string username;
    std::string email;
    std::string passwordHash;
    bool confirmed = false;
    std::chrono::system_clock::time_point createdAt{};
    std::chrono::system_clock::time_point updatedAt{};
};

/// Result of the directory's conditional confirm operation.
enum class ConfirmTransition : uint8_t {
    Confirmed,         ///< This call flipped confirmed from false to true.
    AlreadyConfirmed,  ///< The flag was already set; nothing written.
    NotFound           ///< No account with that id.
};

// -- Session model ------------------------------------------------------------

/// Session protection policy, weakest to strongest.
enum class SessionProtection : uint8_t {
    None,   ///< No re-checks; discouraged.
    Basic,  ///< Client change marks the session non-fresh.
    Strong  ///< Client or account-attribute change destroys the session.
};

/// Session lifetime class chosen at login.
enum class RememberClass : uint8_t { Short, Extended };

/// Request-side attributes used to bind a session to its client.
struct ClientContext {
    std::string remoteAddress;
    std::string userAgent;
};

/// Stored session record.  Owned by SessionAuthenticator.
struct SessionRecord {
    std::string token;  ///< Opaque random session token (hex).
    AccountId accountId;
    RememberClass remember = RememberClass::Short;
    SessionProtection protection = SessionProtection::Strong;
    std::string fingerprint;  ///< Account attribute digest at login.
    std::string clientId;     ///< ClientContext digest at login.
    bool fresh = true;
    std::chrono::system_clock::time_point createdAt{};
    std::chrono::system_clock::time_point expiresAt{};
};

/// Return the configuration name of a protection level.
constexpr std::string_view sessionProtectionName(SessionProtection level) {
    switch (level) {
        case SessionProtection::None:   return "none";
        case SessionProtection::Basic:  return "basic";
        case SessionProtection::Strong: return "strong";
    }
    return "unknown";
}

/// Parse "none" / "basic" / "strong".
[[nodiscard]] std::optional<SessionProtection> parseSessionProtection(std::string_view name);

// -- Configuration ------------------------------------------------------------

/// Longest token or session lifetime accepted.  A time point plus more than
/// this could overflow system_clock's tick count.
inline constexpr std::chrono::seconds kMaxLifetime =
    std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::duration::max()) /
    4;

/// Configuration for the authentication core.
struct AuthConfig {
    /// Secret key for HMAC-SHA256 token signing and fingerprints (>= 32 bytes).
    std::string signingKey = "change-me-in-production-change-me!!";

    /// Retired keys still accepted when verifying tokens (never used to sign).
    std::vector<std::string> previousSigningKeys;

    /// Activation token lifetime.
    std::chrono::seconds activationTokenTtl{3600};  // 1 hour

    /// Protection level applied to sessions created at login.
    SessionProtection sessionProtection = SessionProtection::Strong;

    /// Lifetime of a session created without remember-me.
    std::chrono::seconds shortSessionLifetime{43200};  // 12 hours

    /// Lifetime of a remember-me session.
    std::chrono::seconds rememberSessionLifetime{31536000};  // 365 days

    /// Redirect target when the requested next location is absent or unsafe.
    std::string defaultLandingPath = "/";

    /// scrypt cost: N = 2^scryptLogN.
    uint32_t scryptLogN = 15;

    /// scrypt block size.
    uint32_t scryptR = 8;

    /// scrypt parallelization.
    uint32_t scryptP = 1;

    /// Minimum password length.
    uint32_t minPasswordLength = 8;

    /// Maximum login attempts per client within the rate window.
    uint32_t rateLimitMaxAttempts = 5;

    /// Sliding window duration for rate limiting.
    std::chrono::seconds rateLimitWindow{60};  // 1 minute
};

// -- Request input ------------------------------------------------------------

/// Data submitted by a registration form.
struct RegistrationRequest {
    std::string username;
    std::string email;
    std::string password;
};

/// Data submitted by a login form.
struct LoginRequest {
    std::string username;
    std::string password;
    bool remember = false;
    std::optional<std::string> requestedNext;
    ClientContext client;
};

}  // namespace warden::service
