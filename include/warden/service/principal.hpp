#pragma once

/// @file principal.hpp
/// @brief Resolved identity of the current request.

#include "warden/service/auth_types.hpp"

#include <optional>
#include <utility>

namespace warden::service {

/// Either an authenticated account or anonymous.  Derived per request,
/// never stored.
class Principal {
public:
    /// The anonymous principal.
    static Principal anonymous() { return Principal(); }

    /// An authenticated principal.  fresh is false once the session has been
    /// seen from a client context other than the one it logged in from.
    static Principal authenticated(Account account, bool fresh) {
        Principal p;
        p.account_ = std::move(account);
        p.fresh_ = fresh;
        return p;
    }

    [[nodiscard]] bool isAuthenticated() const noexcept { return account_.has_value(); }
    [[nodiscard]] bool isAnonymous() const noexcept { return !account_.has_value(); }

    /// True for an authenticated principal whose session is still fresh.
    [[nodiscard]] bool isFresh() const noexcept { return account_.has_value() && fresh_; }

    /// The account, or nullptr when anonymous.
    [[nodiscard]] const Account* account() const noexcept {
        return account_ ? &*account_ : nullptr;
    }

    /// The account id, or an invalid id when anonymous.
    [[nodiscard]] AccountId id() const noexcept { return account_ ? account_->id : AccountId{}; }

private:
    Principal() = default;

    std::optional<Account> account_;
    bool fresh_ = false;
};

}  // namespace warden::service
