#pragma once

/// @file current_principal.hpp
/// @brief Request-scoped view of who is making the current request.

#include "warden/foundation/warden_result.hpp"
#include "warden/service/auth_types.hpp"
#include "warden/service/principal.hpp"
#include "warden/service/session_authenticator.hpp"

#include <optional>
#include <string>

namespace warden::service {

/// Lazily resolved principal for a single request.
///
/// Built by the host at the start of a request from the session token the
/// client presented.  Not thread-safe; one instance per request.
///
/// Example:
/// @code
///   CurrentPrincipal current(auth, cookieToken, client);
///   if (current.isAnonymous()) {
///       auto outcome = current.login(request);
///   }
///   setCookie(current.sessionToken());
/// @endcode
class CurrentPrincipal {
public:
    CurrentPrincipal(SessionAuthenticator& authenticator,
                     std::string sessionToken,
                     ClientContext client);

    /// Resolve on first use, then serve the cached value.
    [[nodiscard]] foundation::WardenResult<Principal> get();

    /// False on a directory fault as well as for anonymous requests.
    [[nodiscard]] bool isAuthenticated();

    /// True unless the request resolves to an authenticated principal.
    [[nodiscard]] bool isAnonymous();

    /// Log in through the authenticator.  On success the new session token
    /// replaces the request's token.  The cached principal is dropped either way.
    [[nodiscard]] foundation::WardenResult<LoginOutcome> login(const LoginRequest& request);

    /// Log out and forget the request's token.
    void logout();

    /// The session token the response should carry (empty when none).
    [[nodiscard]] const std::string& sessionToken() const noexcept { return sessionToken_; }

private:
    SessionAuthenticator& authenticator_;
    std::string sessionToken_;
    ClientContext client_;
    std::optional<Principal> cached_;
};

}  // namespace warden::service
