#pragma once

/// @file session_authenticator.hpp
/// @brief Login / logout lifecycle and per-request principal resolution.
///
/// States: Anonymous, Authenticated(session).  Sessions are bound at login
/// to a fingerprint of the account's sensitive attributes and to a digest of
/// the client context; the configured SessionProtection decides what a
/// mismatch does on later requests.

#include "warden/foundation/warden_result.hpp"
#include "warden/service/auth_types.hpp"
#include "warden/service/principal.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace warden::service {

class CredentialHasher;
class IClock;
class ISessionStore;
class IUserDirectory;
class RateLimiter;

/// Outcome of a login attempt.
struct LoginOutcome {
    enum class Status : uint8_t {
        Success,
        UnknownUser,
        BadPassword,
        Throttled  ///< Too many attempts from this client; no check was made.
    };

    Status status = Status::BadPassword;
    std::string redirectTarget;  ///< Set on Success.
    std::string sessionToken;    ///< Set on Success; hand to the client.
    AccountId accountId;         ///< Set on Success.

    [[nodiscard]] bool succeeded() const noexcept { return status == Status::Success; }

    /// Text safe to show the end user.  UnknownUser and BadPassword are
    /// indistinguishable here.
    [[nodiscard]] std::string_view userMessage() const noexcept;
};

/// Session-based authenticator.
///
/// Expected failures (unknown user, wrong password, expired or invalidated
/// session) are reported as values.  Only directory and crypto faults come
/// back as errors.
///
/// Example:
/// @code
///   SessionAuthenticator auth(config, directory, sessions, hasher, clock);
///   auto outcome = auth.login({"alice", "s3cret-pw", false, "/profile", client});
///   if (outcome && outcome.value().succeeded()) {
///       setCookie(outcome.value().sessionToken);
///   }
///   auto principal = auth.resolvePrincipal(cookie, client);
/// @endcode
class SessionAuthenticator {
public:
    SessionAuthenticator(const AuthConfig& config,
                         std::shared_ptr<IUserDirectory> directory,
                         std::shared_ptr<ISessionStore> sessions,
                         std::shared_ptr<const CredentialHasher> hasher,
                         std::shared_ptr<const IClock> clock);

    ~SessionAuthenticator();

    SessionAuthenticator(const SessionAuthenticator&) = delete;
    SessionAuthenticator& operator=(const SessionAuthenticator&) = delete;
    SessionAuthenticator(SessionAuthenticator&&) noexcept;
    SessionAuthenticator& operator=(SessionAuthenticator&&) noexcept;

    /// Verify credentials and, on success, establish a session.
    [[nodiscard]] foundation::WardenResult<LoginOutcome> login(const LoginRequest& request);

    /// Destroy the session unconditionally.  Unknown tokens are ignored.
    void logout(std::string_view sessionToken);

    /// Destroy every session of an account ("sign out everywhere").
    /// Returns the count removed.
    std::size_t logoutAll(AccountId accountId);

    /// Resolve the principal for one request.
    ///
    /// The effective protection is the stricter of the level recorded at
    /// login and the currently configured level.
    [[nodiscard]] foundation::WardenResult<Principal> resolvePrincipal(
        std::string_view sessionToken, const ClientContext& client);

    /// Remove expired sessions from the store and forget throttle state for
    /// clients with no attempt left in the window.  Call periodically.
    /// Returns the count of sessions removed.
    std::size_t purgeExpiredSessions();

    /// The configured protection level.
    [[nodiscard]] SessionProtection protection() const noexcept { return config_.sessionProtection; }

    /// True if target is a same-origin relative path safe to redirect to.
    [[nodiscard]] static bool isSafeRedirect(std::string_view target);

private:
    [[nodiscard]] std::optional<std::string> fingerprint(const Account& account) const;
    [[nodiscard]] std::optional<std::string> clientId(const ClientContext& client) const;

    AuthConfig config_;
    std::shared_ptr<IUserDirectory> directory_;
    std::shared_ptr<ISessionStore> sessions_;
    std::shared_ptr<const CredentialHasher> hasher_;
    std::shared_ptr<const IClock> clock_;
    std::unique_ptr<RateLimiter> rateLimiter_;
};

}  // namespace warden::service
