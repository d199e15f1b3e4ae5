/// @file account_service.cpp
/// @brief AccountService implementation.

#include "warden/service/account_service.hpp"

#include "warden/foundation/error_code.hpp"
#include "warden/foundation/warden_error.hpp"
#include "warden/foundation/warden_logger.hpp"
#include "warden/service/activation_mailer.hpp"
#include "warden/service/activation_service.hpp"
#include "warden/service/clock.hpp"
#include "warden/service/credential_hasher.hpp"
#include "warden/service/input_validator.hpp"
#include "warden/service/user_directory.hpp"

namespace warden::service {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::WardenError;
using foundation::WardenResult;

// -- Construction -------------------------------------------------------------

AccountService::AccountService(const AuthConfig& config,
                               std::shared_ptr<IUserDirectory> directory,
                               std::shared_ptr<const CredentialHasher> hasher,
                               std::shared_ptr<const ActivationService> activation,
                               std::shared_ptr<IActivationMailer> mailer,
                               std::shared_ptr<const IClock> clock)
    : minPasswordLength_(config.minPasswordLength),
      directory_(std::move(directory)),
      hasher_(std::move(hasher)),
      activation_(std::move(activation)),
      mailer_(std::move(mailer)),
      clock_(std::move(clock)) {}

// -- Registration -------------------------------------------------------------

WardenResult<Registration> AccountService::registerAccount(const RegistrationRequest& request) {
    if (auto check = InputValidator::validateUsername(request.username); !check) {
        return WardenResult<Registration>::err(
            WardenError(ErrorCode::InvalidUsername, std::move(check.message)));
    }
    if (auto check = InputValidator::validateEmail(request.email); !check) {
        return WardenResult<Registration>::err(
            WardenError(ErrorCode::InvalidEmail, std::move(check.message)));
    }
    if (auto check = InputValidator::validatePassword(request.password, minPasswordLength_);
        !check) {
        return WardenResult<Registration>::err(
            WardenError(ErrorCode::WeakPassword, std::move(check.message)));
    }

    auto byName = directory_->findByUsername(request.username);
    if (!byName) {
        return WardenResult<Registration>::err(byName.error());
    }
    if (byName.value().has_value()) {
        return WardenResult<Registration>::err(
            WardenError(ErrorCode::AlreadyExists, "username already taken"));
    }

    auto byEmail = directory_->findByEmail(request.email);
    if (!byEmail) {
        return WardenResult<Registration>::err(byEmail.error());
    }
    if (byEmail.value().has_value()) {
        return WardenResult<Registration>::err(
            WardenError(ErrorCode::AlreadyExists, "email already registered"));
    }

    auto hashed = hasher_->hash(request.password);
    if (!hashed) {
        return WardenResult<Registration>::err(hashed.error());
    }

    Account account;
    account.username = request.username;
    account.email = request.email;
    account.passwordHash = std::move(hashed.value().encoded);
    account.confirmed = false;
    account.createdAt = clock_->now();
    account.updatedAt = account.createdAt;

    // create() re-checks uniqueness, which covers a concurrent registration.
    auto created = directory_->create(account);
    if (!created) {
        return WardenResult<Registration>::err(created.error());
    }
    account.id = created.value();

    LogContext ctx;
    ctx.accountId = account.id;
    WARDEN_LOG_CTX(LogLevel::Info, LogCategory::Directory, "Account registered", ctx);

    auto token = activation_->issueFor(account.id);
    if (!token) {
        WARDEN_LOG_CTX(LogLevel::Error, LogCategory::Activation,
                       "Registered account but could not issue activation token", ctx);
        return WardenResult<Registration>::err(token.error());
    }
    mailer_->deliver(account.email, token.value());

    Registration registration;
    registration.account = std::move(account);
    registration.activationToken = std::move(token).value();
    return WardenResult<Registration>::ok(std::move(registration));
}

WardenResult<std::string> AccountService::resendActivation(AccountId id) {
    auto account = loadAccount(id);
    if (!account) {
        return WardenResult<std::string>::err(account.error());
    }
    if (account.value().confirmed) {
        return WardenResult<std::string>::err(
            WardenError(ErrorCode::AlreadyConfirmed, "account is already confirmed"));
    }

    auto token = activation_->issueFor(id);
    if (!token) {
        return token;
    }
    mailer_->deliver(account.value().email, token.value());
    return token;
}

// -- Settings -----------------------------------------------------------------

WardenResult<void> AccountService::changePassword(AccountId id,
                                                  std::string_view currentPassword,
                                                  std::string_view newPassword) {
    auto account = loadAccount(id);
    if (!account) {
        return WardenResult<void>::err(account.error());
    }
    if (!hasher_->verify(currentPassword, account.value().passwordHash)) {
        return WardenResult<void>::err(
            WardenError(ErrorCode::InvalidCredentials, "current password is incorrect"));
    }
    if (auto check = InputValidator::validatePassword(newPassword, minPasswordLength_); !check) {
        return WardenResult<void>::err(
            WardenError(ErrorCode::WeakPassword, std::move(check.message)));
    }

    auto hashed = hasher_->hash(newPassword);
    if (!hashed) {
        return WardenResult<void>::err(hashed.error());
    }

    Account updated = std::move(account).value();
    updated.passwordHash = std::move(hashed.value().encoded);
    updated.updatedAt = clock_->now();
    auto saved = directory_->update(updated);
    if (saved) {
        LogContext ctx;
        ctx.accountId = id;
        WARDEN_LOG_CTX(LogLevel::Info, LogCategory::Credential, "Password changed", ctx);
    }
    return saved;
}

WardenResult<void> AccountService::changeEmail(AccountId id, std::string_view newEmail) {
    if (auto check = InputValidator::validateEmail(newEmail); !check) {
        return WardenResult<void>::err(
            WardenError(ErrorCode::InvalidEmail, std::move(check.message)));
    }

    auto account = loadAccount(id);
    if (!account) {
        return WardenResult<void>::err(account.error());
    }
    if (account.value().email == newEmail) {
        return WardenResult<void>::ok();
    }

    auto owner = directory_->findByEmail(newEmail);
    if (!owner) {
        return WardenResult<void>::err(owner.error());
    }
    if (owner.value().has_value()) {
        return WardenResult<void>::err(
            WardenError(ErrorCode::AlreadyExists, "email already registered"));
    }

    Account updated = std::move(account).value();
    updated.email = std::string(newEmail);
    updated.updatedAt = clock_->now();
    auto saved = directory_->update(updated);
    if (saved) {
        LogContext ctx;
        ctx.accountId = id;
        WARDEN_LOG_CTX(LogLevel::Info, LogCategory::Directory, "Email changed", ctx);
    }
    return saved;
}

// -- Helpers ------------------------------------------------------------------

WardenResult<Account> AccountService::loadAccount(AccountId id) const {
    auto found = directory_->findById(id);
    if (!found) {
        return WardenResult<Account>::err(found.error());
    }
    if (!found.value().has_value()) {
        return WardenResult<Account>::err(
            WardenError(ErrorCode::AccountNotFound, "account not found"));
    }
    return WardenResult<Account>::ok(std::move(*found.value()));
}

}  // namespace warden::service
