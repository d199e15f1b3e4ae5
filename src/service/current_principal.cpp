/// @file current_principal.cpp
/// @brief CurrentPrincipal implementation.

#include "warden/service/current_principal.hpp"

#include <utility>

namespace warden::service {

using foundation::WardenResult;

CurrentPrincipal::CurrentPrincipal(SessionAuthenticator& authenticator,
                                   std::string sessionToken,
                                   ClientContext client)
    : authenticator_(authenticator),
      sessionToken_(std::move(sessionToken)),
      client_(std::move(client)) {}

WardenResult<Principal> CurrentPrincipal::get() {
    if (cached_) {
        return WardenResult<Principal>::ok(*cached_);
    }
    auto resolved = authenticator_.resolvePrincipal(sessionToken_, client_);
    if (!resolved) {
        // Faults are not cached; a later call may succeed.
        return resolved;
    }
    if (resolved.value().isAnonymous()) {
        // The session is gone (or never existed); stop presenting its token.
        sessionToken_.clear();
    }
    cached_ = resolved.value();
    return resolved;
}

bool CurrentPrincipal::isAuthenticated() {
    auto principal = get();
    return principal && principal.value().isAuthenticated();
}

bool CurrentPrincipal::isAnonymous() {
    return !isAuthenticated();
}

WardenResult<LoginOutcome> CurrentPrincipal::login(const LoginRequest& request) {
    cached_.reset();
    auto outcome = authenticator_.login(request);
    if (outcome && outcome.value().succeeded()) {
        if (!sessionToken_.empty()) {
            // Never carry a pre-login session across the privilege change.
            authenticator_.logout(sessionToken_);
        }
        sessionToken_ = outcome.value().sessionToken;
    }
    return outcome;
}

void CurrentPrincipal::logout() {
    authenticator_.logout(sessionToken_);
    sessionToken_.clear();
    cached_ = Principal::anonymous();
}

}  // namespace warden::service
