/// @file activation_service.cpp
/// @brief ActivationService implementation.

#include "warden/service/activation_service.hpp"

#include "warden/foundation/warden_logger.hpp"
#include "warden/service/user_directory.hpp"

namespace warden::service {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::WardenResult;

namespace {

constexpr std::string_view kIdClaim = "id";

}  // anonymous namespace

std::string_view ActivationOutcome::userMessage() const noexcept {
    switch (status) {
        case Status::Confirmed:
            return "You have confirmed your account. Thanks!";
        case Status::AlreadyConfirmed:
            return "Your account is already confirmed.";
        case Status::UnknownAccount:
        case Status::Invalid:
            break;
    }
    return "The confirmation link is invalid or has expired.";
}

ActivationService::ActivationService(const AuthConfig& config,
                                     std::shared_ptr<const TokenSigner> signer,
                                     std::shared_ptr<IUserDirectory> directory)
    : ttl_(config.activationTokenTtl),
      signer_(std::move(signer)),
      directory_(std::move(directory)) {}

WardenResult<std::string> ActivationService::issueFor(AccountId id) const {
    return issueFor(id, ttl_);
}

WardenResult<std::string> ActivationService::issueFor(AccountId id,
                                                      std::chrono::seconds ttl) const {
    TokenPayload payload;
    payload.emplace(std::string(kIdClaim), static_cast<int64_t>(id.value()));
    return signer_->issue(payload, ttl);
}

WardenResult<ActivationOutcome> ActivationService::redeem(std::string_view token) const {
    auto decoded = signer_->redeem(token);
    if (decoded.hasError()) {
        LogContext ctx;
        ctx.extra["reason"] = std::string(tokenErrorName(decoded.error()));
        WARDEN_LOG_CTX(LogLevel::Info, LogCategory::Activation, "Activation token refused", ctx);
        return WardenResult<ActivationOutcome>::ok(ActivationOutcome::invalid(decoded.error()));
    }

    // An authentic token without a usable id is treated like an unparseable one.
    const auto& payload = decoded.value();
    auto it = payload.find(std::string(kIdClaim));
    const auto* rawId = it != payload.end() ? std::get_if<int64_t>(&it->second) : nullptr;
    if (rawId == nullptr || *rawId <= 0) {
        WARDEN_LOG_WARN(LogCategory::Activation, "Activation token carries no account id");
        return WardenResult<ActivationOutcome>::ok(
            ActivationOutcome::invalid(TokenError::Malformed));
    }
    AccountId id(static_cast<uint64_t>(*rawId));

    LogContext ctx;
    ctx.accountId = id;

    auto account = directory_->findById(id);
    if (account.hasError()) {
        return WardenResult<ActivationOutcome>::err(account.error());
    }
    if (!account.value().has_value()) {
        WARDEN_LOG_CTX(LogLevel::Info, LogCategory::Activation,
                       "Activation token names an unknown account", ctx);
        return WardenResult<ActivationOutcome>::ok(ActivationOutcome::unknownAccount());
    }
    if (account.value()->confirmed) {
        return WardenResult<ActivationOutcome>::ok(ActivationOutcome::alreadyConfirmed(id));
    }

    // Conditional write: only one concurrent redemption observes the transition.
    auto transition = directory_->markConfirmed(id);
    if (transition.hasError()) {
        return WardenResult<ActivationOutcome>::err(transition.error());
    }
    switch (transition.value()) {
        case ConfirmTransition::Confirmed:
            WARDEN_LOG_CTX(LogLevel::Info, LogCategory::Activation, "Account confirmed", ctx);
            return WardenResult<ActivationOutcome>::ok(ActivationOutcome::confirmed(id));
        case ConfirmTransition::AlreadyConfirmed:
            return WardenResult<ActivationOutcome>::ok(ActivationOutcome::alreadyConfirmed(id));
        case ConfirmTransition::NotFound:
            break;
    }
    return WardenResult<ActivationOutcome>::ok(ActivationOutcome::unknownAccount());
}

}  // namespace warden::service
