#pragma once

/// @file user_directory.hpp
/// @brief Account persistence interface and in-memory implementation.
///
/// Abstracts account storage so the authentication core can work with any
/// backend.  Storage failures surface as ErrorCode::DirectoryUnavailable;
/// "no such account" is an empty optional, not an error.

#include "warden/foundation/warden_result.hpp"
#include "warden/service/auth_types.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <unordered_map>

namespace warden::service {

/// Abstract interface for account persistence.
///
/// Implementations must be thread-safe when shared across threads, and must
/// enforce username and email uniqueness in create() and update().
class IUserDirectory {
public:
    virtual ~IUserDirectory() = default;

    /// Find an account by its unique ID.
    [[nodiscard]] virtual foundation::WardenResult<std::optional<Account>> findById(
        AccountId id) const = 0;

    /// Find an account by username (case-sensitive).
    [[nodiscard]] virtual foundation::WardenResult<std::optional<Account>> findByUsername(
        std::string_view username) const = 0;

    /// Find an account by email (case-sensitive).
    [[nodiscard]] virtual foundation::WardenResult<std::optional<Account>> findByEmail(
        std::string_view email) const = 0;

    /// Create a new account, returning the assigned ID.
    /// Fails with AlreadyExists if the username or email is taken.
    [[nodiscard]] virtual foundation::WardenResult<AccountId> create(Account account) = 0;

    /// Replace an existing account record.  The confirmed flag is not written
    /// here; it only ever changes through markConfirmed().
    /// Fails with AccountNotFound, or AlreadyExists on a uniqueness clash.
    [[nodiscard]] virtual foundation::WardenResult<void> update(const Account& account) = 0;

    /// Atomically set confirmed = true if it is currently false.
    [[nodiscard]] virtual foundation::WardenResult<ConfirmTransition> markConfirmed(
        AccountId id) = 0;
};

/// Thread-safe in-memory directory for testing and development.
class InMemoryUserDirectory : public IUserDirectory {
public:
    [[nodiscard]] foundation::WardenResult<std::optional<Account>> findById(
        AccountId id) const override;

    [[nodiscard]] foundation::WardenResult<std::optional<Account>> findByUsername(
        std::string_view username) const override;

    [[nodiscard]] foundation::WardenResult<std::optional<Account>> findByEmail(
        std::string_view email) const override;

    [[nodiscard]] foundation::WardenResult<AccountId> create(Account account) override;

    [[nodiscard]] foundation::WardenResult<void> update(const Account& account) override;

    [[nodiscard]] foundation::WardenResult<ConfirmTransition> markConfirmed(
        AccountId id) override;

    /// Number of stored accounts.
    [[nodiscard]] std::size_t size() const;

private:
    /// Caller holds mutex_.
    [[nodiscard]] bool taken(std::string_view username,
                             std::string_view email,
                             AccountId except) const;

    mutable std::mutex mutex_;
    std::unordered_map<AccountId, Account> accounts_;
    uint64_t nextId_ = 1;
};

}  // namespace warden::service
