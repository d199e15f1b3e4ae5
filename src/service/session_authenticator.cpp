/// @file session_authenticator.cpp
/// @brief SessionAuthenticator implementation.

#include "warden/service/session_authenticator.hpp"

#include "warden/foundation/error_code.hpp"
#include "warden/foundation/warden_error.hpp"
#include "warden/foundation/warden_logger.hpp"
#include "warden/service/clock.hpp"
#include "warden/service/credential_hasher.hpp"
#include "warden/service/rate_limiter.hpp"
#include "warden/service/session_store.hpp"
#include "warden/service/user_directory.hpp"

#include "crypto_utils.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace warden::service {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::WardenError;
using foundation::WardenResult;

namespace {

constexpr std::size_t kSessionTokenBytes = 32;

// Stands in for a stored hash when the username is unknown; never parses,
// so verify() burns one derivation at the configured cost and fails.
constexpr std::string_view kNoCredential = "!";

/// First characters of a session token, for log correlation.
std::string tokenPrefix(std::string_view token) {
    return std::string(token.substr(0, 8));
}

LogContext sessionContext(const SessionRecord& record) {
    LogContext ctx;
    ctx.accountId = record.accountId;
    ctx.sessionId = tokenPrefix(record.token);
    return ctx;
}

WardenError cryptoFault(std::string message) {
    return WardenError(ErrorCode::CryptoFailure, std::move(message));
}

}  // anonymous namespace

// -- LoginOutcome -------------------------------------------------------------

std::string_view LoginOutcome::userMessage() const noexcept {
    switch (status) {
        case Status::Success:
            return "You are now logged in.";
        case Status::Throttled:
            return "Too many login attempts. Please try again later.";
        case Status::UnknownUser:
        case Status::BadPassword:
            break;
    }
    return "Invalid username or password.";
}

// -- Construction / destruction -----------------------------------------------

SessionAuthenticator::SessionAuthenticator(const AuthConfig& config,
                                           std::shared_ptr<IUserDirectory> directory,
                                           std::shared_ptr<ISessionStore> sessions,
                                           std::shared_ptr<const CredentialHasher> hasher,
                                           std::shared_ptr<const IClock> clock)
    : config_(config),
      directory_(std::move(directory)),
      sessions_(std::move(sessions)),
      hasher_(std::move(hasher)),
      clock_(std::move(clock)),
      rateLimiter_(std::make_unique<RateLimiter>(
          config_.rateLimitMaxAttempts, config_.rateLimitWindow, clock_)) {}

SessionAuthenticator::~SessionAuthenticator() = default;
SessionAuthenticator::SessionAuthenticator(SessionAuthenticator&&) noexcept = default;
SessionAuthenticator& SessionAuthenticator::operator=(SessionAuthenticator&&) noexcept = default;

// -- Login --------------------------------------------------------------------

WardenResult<LoginOutcome> SessionAuthenticator::login(const LoginRequest& request) {
    LoginOutcome outcome;
    LogContext ctx;
    ctx.clientAddress = request.client.remoteAddress;

    if (!rateLimiter_->allow(request.client.remoteAddress)) {
        WARDEN_LOG_CTX(LogLevel::Warning, LogCategory::Session, "Login throttled", ctx);
        outcome.status = LoginOutcome::Status::Throttled;
        return WardenResult<LoginOutcome>::ok(std::move(outcome));
    }

    auto lookup = directory_->findByUsername(request.username);
    if (lookup.hasError()) {
        return WardenResult<LoginOutcome>::err(lookup.error());
    }

    if (!lookup.value().has_value()) {
        // Same cost as the wrong-password branch.
        static_cast<void>(hasher_->verify(request.password, kNoCredential));
        WARDEN_LOG_CTX(LogLevel::Info, LogCategory::Session, "Login failed", ctx);
        outcome.status = LoginOutcome::Status::UnknownUser;
        return WardenResult<LoginOutcome>::ok(std::move(outcome));
    }

    const Account& account = *lookup.value();
    ctx.accountId = account.id;

    if (!hasher_->verify(request.password, account.passwordHash)) {
        WARDEN_LOG_CTX(LogLevel::Info, LogCategory::Session, "Login failed", ctx);
        outcome.status = LoginOutcome::Status::BadPassword;
        return WardenResult<LoginOutcome>::ok(std::move(outcome));
    }

    auto fp = fingerprint(account);
    auto cid = clientId(request.client);
    std::vector<uint8_t> tokenBytes(kSessionTokenBytes);
    if (!fp || !cid || !detail::secureRandomBytes(tokenBytes)) {
        return WardenResult<LoginOutcome>::err(cryptoFault("failed to establish session"));
    }

    auto now = clock_->now();
    SessionRecord record;
    record.token = detail::toHex(tokenBytes.data(), tokenBytes.size());
    record.accountId = account.id;
    record.remember = request.remember ? RememberClass::Extended : RememberClass::Short;
    record.protection = config_.sessionProtection;
    record.fingerprint = std::move(*fp);
    record.clientId = std::move(*cid);
    record.fresh = true;
    record.createdAt = now;
    record.expiresAt = now + (request.remember ? config_.rememberSessionLifetime
                                               : config_.shortSessionLifetime);

    ctx.sessionId = tokenPrefix(record.token);
    ctx.extra["remember"] = request.remember ? "true" : "false";
    WARDEN_LOG_CTX(LogLevel::Info, LogCategory::Session, "Login succeeded", ctx);

    rateLimiter_->reset(request.client.remoteAddress);

    outcome.status = LoginOutcome::Status::Success;
    outcome.sessionToken = record.token;
    outcome.accountId = account.id;
    outcome.redirectTarget = (request.requestedNext && isSafeRedirect(*request.requestedNext))
                                 ? *request.requestedNext
                                 : config_.defaultLandingPath;
    sessions_->create(std::move(record));
    return WardenResult<LoginOutcome>::ok(std::move(outcome));
}

// -- Logout -------------------------------------------------------------------

void SessionAuthenticator::logout(std::string_view sessionToken) {
    if (sessionToken.empty()) {
        return;
    }
    if (sessions_->destroy(sessionToken)) {
        LogContext ctx;
        ctx.sessionId = tokenPrefix(sessionToken);
        WARDEN_LOG_CTX(LogLevel::Info, LogCategory::Session, "Logged out", ctx);
    }
}

std::size_t SessionAuthenticator::logoutAll(AccountId accountId) {
    auto removed = sessions_->destroyAllForAccount(accountId);
    LogContext ctx;
    ctx.accountId = accountId;
    ctx.extra["sessions"] = std::to_string(removed);
    WARDEN_LOG_CTX(LogLevel::Info, LogCategory::Session, "Logged out everywhere", ctx);
    return removed;
}

// -- Principal resolution -----------------------------------------------------

WardenResult<Principal> SessionAuthenticator::resolvePrincipal(std::string_view sessionToken,
                                                               const ClientContext& client) {
    if (sessionToken.empty()) {
        return WardenResult<Principal>::ok(Principal::anonymous());
    }

    auto found = sessions_->find(sessionToken);
    if (!found) {
        return WardenResult<Principal>::ok(Principal::anonymous());
    }
    SessionRecord& record = *found;
    auto ctx = sessionContext(record);

    if (clock_->now() >= record.expiresAt) {
        sessions_->destroy(record.token);
        WARDEN_LOG_CTX(LogLevel::Debug, LogCategory::Session, "Session expired", ctx);
        return WardenResult<Principal>::ok(Principal::anonymous());
    }

    auto lookup = directory_->findById(record.accountId);
    if (lookup.hasError()) {
        return WardenResult<Principal>::err(lookup.error());
    }
    if (!lookup.value().has_value()) {
        sessions_->destroy(record.token);
        WARDEN_LOG_CTX(LogLevel::Warning, LogCategory::Session,
                       "Session refers to a missing account", ctx);
        return WardenResult<Principal>::ok(Principal::anonymous());
    }
    Account account = std::move(*lookup.value());

    auto level = std::max(record.protection, config_.sessionProtection);
    if (level == SessionProtection::None) {
        return WardenResult<Principal>::ok(Principal::authenticated(std::move(account), record.fresh));
    }

    auto cid = clientId(client);
    if (!cid) {
        return WardenResult<Principal>::err(cryptoFault("failed to digest client context"));
    }
    const bool sameClient = detail::constantTimeEqual(*cid, record.clientId);

    if (level == SessionProtection::Basic) {
        if (!sameClient && record.fresh) {
            record.fresh = false;
            if (!sessions_->update(record)) {
                // Logged out concurrently.
                return WardenResult<Principal>::ok(Principal::anonymous());
            }
            WARDEN_LOG_CTX(LogLevel::Info, LogCategory::Session,
                           "Session seen from a new client; marked non-fresh", ctx);
        }
        return WardenResult<Principal>::ok(Principal::authenticated(std::move(account), record.fresh));
    }

    // Strong: any drift in client or account attributes ends the session.
    auto fp = fingerprint(account);
    if (!fp) {
        return WardenResult<Principal>::err(cryptoFault("failed to fingerprint account"));
    }
    const bool sameAccount = detail::constantTimeEqual(*fp, record.fingerprint);
    if (!sameClient || !sameAccount) {
        sessions_->destroy(record.token);
        ctx.extra["cause"] = sameAccount ? "client_changed" : "account_changed";
        WARDEN_LOG_CTX(LogLevel::Info, LogCategory::Session, "Session invalidated", ctx);
        return WardenResult<Principal>::ok(Principal::anonymous());
    }
    return WardenResult<Principal>::ok(Principal::authenticated(std::move(account), record.fresh));
}

std::size_t SessionAuthenticator::purgeExpiredSessions() {
    auto removed = sessions_->removeExpired(clock_->now());
    auto idleClients = rateLimiter_->pruneIdle();
    if (removed > 0 || idleClients > 0) {
        LogContext ctx;
        ctx.extra["sessions"] = std::to_string(removed);
        ctx.extra["idle_clients"] = std::to_string(idleClients);
        WARDEN_LOG_CTX(LogLevel::Info, LogCategory::Session, "Housekeeping", ctx);
    }
    return removed;
}

// -- Helpers ------------------------------------------------------------------

bool SessionAuthenticator::isSafeRedirect(std::string_view target) {
    // Relative path on this origin only: "/x", never "//host" or "/\host".
    if (target.empty() || target.front() != '/') {
        return false;
    }
    if (target.size() > 1 && (target[1] == '/' || target[1] == '\\')) {
        return false;
    }
    return std::none_of(target.begin(), target.end(), [](char c) {
        auto uc = static_cast<unsigned char>(c);
        return c == '\\' || std::iscntrl(uc) != 0 || c == ' ';
    });
}

std::optional<std::string> SessionAuthenticator::fingerprint(const Account& account) const {
    // Length-prefixed fields so no two attribute sets serialize alike.
    std::string material;
    for (std::string_view field : {std::string_view(account.username),
                                   std::string_view(account.email),
                                   std::string_view(account.passwordHash)}) {
        material += std::to_string(field.size());
        material += ':';
        material += field;
    }
    material += std::to_string(account.id.value());

    detail::Digest mac{};
    if (!detail::hmacSha256(config_.signingKey, material, mac)) {
        return std::nullopt;
    }
    return detail::toHex(mac);
}

std::optional<std::string> SessionAuthenticator::clientId(const ClientContext& client) const {
    detail::Digest digest{};
    if (!detail::sha256(client.remoteAddress + "|" + client.userAgent, digest)) {
        return std::nullopt;
    }
    return detail::toHex(digest);
}

}  // namespace warden::service
