#pragma once

/// @file token_signer.hpp
/// @brief Tamper-evident, time-limited tokens signed with HMAC-SHA256.
///
/// Token format (URL-safe, no padding):
///
///   base64url(body) . base64url(HMAC-SHA256(key, base64url(body)))
///
/// body: {"exp":N,"iat":N,"pl":{...payload...}}

#include "warden/core/result.hpp"
#include "warden/foundation/warden_result.hpp"
#include "warden/service/auth_types.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace warden::service {

class IClock;

/// A payload value: integer, string or boolean.
using TokenValue = std::variant<int64_t, std::string, bool>;

/// Flat payload carried by a token.
using TokenPayload = std::map<std::string, TokenValue>;

/// Reasons a token is refused.
enum class TokenError : uint8_t {
    Malformed,     ///< Not parseable as a token at all.
    BadSignature,  ///< Integrity check failed (tampered or foreign key).
    Expired        ///< Authentic but past its expiry.
};

/// Return a log-friendly name for a token error.
constexpr std::string_view tokenErrorName(TokenError error) {
    switch (error) {
        case TokenError::Malformed:    return "malformed";
        case TokenError::BadSignature: return "bad_signature";
        case TokenError::Expired:      return "expired";
    }
    return "unknown";
}

/// Result of redeeming a token.
using TokenResult = warden::Result<TokenPayload, TokenError>;

/// Issues and verifies signed expiring tokens.
///
/// Immutable after construction; safe to share across threads.
///
/// Example:
/// @code
///   TokenSigner signer(config, std::make_shared<SystemClock>());
///   auto token = signer.issue({{"id", int64_t{42}}}, std::chrono::seconds{3600});
///   auto payload = signer.redeem(token.value());
/// @endcode
class TokenSigner {
public:
    TokenSigner(const AuthConfig& config, std::shared_ptr<const IClock> clock);

    /// Sign payload with an absolute expiry of now + ttl.
    ///
    /// Fails with TokenLifetimeOutOfRange when |ttl| exceeds kMaxLifetime, or
    /// CryptoFailure if OpenSSL cannot compute the MAC.
    [[nodiscard]] foundation::WardenResult<std::string> issue(const TokenPayload& payload,
                                                              std::chrono::seconds ttl) const;

    /// Verify and decode a token.
    ///
    /// The signature is checked before anything in the body is parsed, so
    /// expiry is only ever evaluated on an authentic payload.
    [[nodiscard]] TokenResult redeem(std::string_view token) const;

private:
    [[nodiscard]] bool signatureMatches(std::string_view body, std::string_view signature) const;

    std::string signingKey_;
    std::vector<std::string> previousKeys_;
    std::shared_ptr<const IClock> clock_;
};

}  // namespace warden::service
