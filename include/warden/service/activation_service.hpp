#pragma once

/// @file activation_service.hpp
/// @brief Account activation through signed, expiring tokens.
///
/// Tokens carry only the account id.  Redemption is idempotent: the first
/// successful redemption confirms the account, later ones report
/// AlreadyConfirmed.  No used-token set is kept.

#include "warden/foundation/warden_result.hpp"
#include "warden/service/auth_types.hpp"
#include "warden/service/token_signer.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace warden::service {

class IUserDirectory;

/// Outcome of an activation attempt.
struct ActivationOutcome {
    enum class Status : uint8_t {
        Confirmed,         ///< This redemption confirmed the account.
        AlreadyConfirmed,  ///< Account was confirmed earlier; nothing changed.
        UnknownAccount,    ///< Token is authentic but names no account.
        Invalid            ///< Token refused; see reason.
    };

    Status status = Status::Invalid;
    AccountId accountId;               ///< Set for Confirmed / AlreadyConfirmed.
    std::optional<TokenError> reason;  ///< Set for Invalid; for logs only.

    [[nodiscard]] bool succeeded() const noexcept {
        return status == Status::Confirmed || status == Status::AlreadyConfirmed;
    }

    /// Text safe to show the end user.  Never reveals which check failed.
    [[nodiscard]] std::string_view userMessage() const noexcept;

    static ActivationOutcome confirmed(AccountId id) { return {Status::Confirmed, id, {}}; }
    static ActivationOutcome alreadyConfirmed(AccountId id) {
        return {Status::AlreadyConfirmed, id, {}};
    }
    static ActivationOutcome unknownAccount() { return {Status::UnknownAccount, {}, {}}; }
    static ActivationOutcome invalid(TokenError why) { return {Status::Invalid, {}, why}; }
};

/// Issues and redeems activation tokens.
///
/// Example:
/// @code
///   ActivationService activation(config, signer, directory);
///   auto token = activation.issueFor(account.id);
///   auto outcome = activation.redeem(token.value());
///   if (outcome && outcome.value().succeeded()) { ... }
/// @endcode
class ActivationService {
public:
    ActivationService(const AuthConfig& config,
                      std::shared_ptr<const TokenSigner> signer,
                      std::shared_ptr<IUserDirectory> directory);

    /// Mint a token for account id with the configured activation ttl.
    [[nodiscard]] foundation::WardenResult<std::string> issueFor(AccountId id) const;

    /// Mint a token for account id with an explicit ttl (at most kMaxLifetime).
    [[nodiscard]] foundation::WardenResult<std::string> issueFor(AccountId id,
                                                                 std::chrono::seconds ttl) const;

    /// Redeem a token, confirming the account it names at most once.
    ///
    /// Every expected failure is an outcome; only directory faults are errors.
    [[nodiscard]] foundation::WardenResult<ActivationOutcome> redeem(std::string_view token) const;

private:
    std::chrono::seconds ttl_;
    std::shared_ptr<const TokenSigner> signer_;
    std::shared_ptr<IUserDirectory> directory_;
};

}  // namespace warden::service
