#pragma once

/// @file credential_hasher.hpp
/// @brief Password hashing and verification with scrypt.
///
/// Each hash carries its own random salt and cost parameters in a
/// self-describing string:
///
///   $scrypt$ln=15,r=8,p=1$<base64url salt>$<base64url derived key>
///
/// so the configured cost can be raised without invalidating stored hashes.

#include "warden/foundation/warden_result.hpp"
#include "warden/service/auth_types.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace warden::service {

/// Encoded password hash as persisted in Account::passwordHash.
struct HashedCredential {
    std::string encoded;
};

/// scrypt cost parameters (N = 2^logN).
struct ScryptParams {
    uint32_t logN = 15;
    uint32_t r = 8;
    uint32_t p = 1;

    bool operator==(const ScryptParams&) const = default;
};

/// One-way password hashing with constant-time verification.
///
/// Example:
/// @code
///   CredentialHasher hasher(config);
///   auto hashed = hasher.hash("my_password");
///   if (hashed) {
///       bool ok = hasher.verify("my_password", hashed.value().encoded);
///   }
/// @endcode
class CredentialHasher {
public:
    /// Construct with default cost parameters.
    CredentialHasher() = default;

    /// Construct with the cost parameters from the auth configuration.
    explicit CredentialHasher(const AuthConfig& config);

    /// Construct with explicit cost parameters.
    explicit CredentialHasher(ScryptParams params);

    /// Hash a plaintext password with a newly generated random salt.
    ///
    /// Fails only when OpenSSL cannot produce randomness or the derivation
    /// (ErrorCode::CryptoFailure).
    [[nodiscard]] foundation::WardenResult<HashedCredential> hash(std::string_view password) const;

    /// Verify a plaintext password against a stored encoded hash.
    ///
    /// Returns false on mismatch and on malformed or out-of-bounds stored
    /// input.  A malformed hash still costs one derivation at the configured
    /// parameters, so callers cannot tell it apart from a wrong password.
    [[nodiscard]] bool verify(std::string_view password, std::string_view encoded) const;

    /// True when the stored hash was produced with different cost parameters
    /// than the configured ones (or cannot be parsed).
    [[nodiscard]] bool needsRehash(std::string_view encoded) const;

    /// True when params are accepted: ln 1..20, r 1..32, p 1..16 and at most
    /// 1 GiB of working memory.
    [[nodiscard]] static bool withinBounds(const ScryptParams& params);

    /// The configured cost parameters.
    [[nodiscard]] const ScryptParams& params() const noexcept { return params_; }

private:
    ScryptParams params_;
};

}  // namespace warden::service
