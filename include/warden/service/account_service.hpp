#pragma once

/// @file account_service.hpp
/// @brief Account registration and self-service changes.
///
/// Orchestrates InputValidator, CredentialHasher, IUserDirectory and
/// ActivationService the way a web front end's registration and settings
/// pages would.

#include "warden/foundation/warden_result.hpp"
#include "warden/service/auth_types.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace warden::service {

class ActivationService;
class CredentialHasher;
class IActivationMailer;
class IClock;
class IUserDirectory;

/// Result of a successful registration.
struct Registration {
    Account account;              ///< As stored; unconfirmed.
    std::string activationToken;  ///< Already handed to the mailer.
};

/// Account lifecycle operations outside login.
///
/// Validation failures are errors carrying InvalidUsername, InvalidEmail,
/// WeakPassword, AlreadyExists or InvalidCredentials, with a message that is
/// safe to show the user.
class AccountService {
public:
    AccountService(const AuthConfig& config,
                   std::shared_ptr<IUserDirectory> directory,
                   std::shared_ptr<const CredentialHasher> hasher,
                   std::shared_ptr<const ActivationService> activation,
                   std::shared_ptr<IActivationMailer> mailer,
                   std::shared_ptr<const IClock> clock);

    /// Validate, create an unconfirmed account and send its activation token.
    [[nodiscard]] foundation::WardenResult<Registration> registerAccount(
        const RegistrationRequest& request);

    /// Issue and send a fresh activation token for an unconfirmed account.
    /// Fails with AccountNotFound or AlreadyConfirmed.
    [[nodiscard]] foundation::WardenResult<std::string> resendActivation(AccountId id);

    /// Replace the password after checking the current one.
    ///
    /// The new hash changes the account fingerprint, so Strong sessions
    /// opened before the change stop resolving.
    [[nodiscard]] foundation::WardenResult<void> changePassword(AccountId id,
                                                                std::string_view currentPassword,
                                                                std::string_view newPassword);

    /// Replace the email address.  The confirmed flag is left as it is.
    [[nodiscard]] foundation::WardenResult<void> changeEmail(AccountId id,
                                                             std::string_view newEmail);

private:
    [[nodiscard]] foundation::WardenResult<Account> loadAccount(AccountId id) const;

    uint32_t minPasswordLength_;
    std::shared_ptr<IUserDirectory> directory_;
    std::shared_ptr<const CredentialHasher> hasher_;
    std::shared_ptr<const ActivationService> activation_;
    std::shared_ptr<IActivationMailer> mailer_;
    std::shared_ptr<const IClock> clock_;
};

}  // namespace warden::service
