/// @file user_directory.cpp
/// @brief InMemoryUserDirectory implementation.

#include "warden/service/user_directory.hpp"

#include <chrono>

namespace warden::service {

using foundation::ErrorCode;
using foundation::WardenError;
using foundation::WardenResult;

using AccountLookup = WardenResult<std::optional<Account>>;

AccountLookup InMemoryUserDirectory::findById(AccountId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(id);
    if (it == accounts_.end()) {
        return AccountLookup::ok(std::nullopt);
    }
    return AccountLookup::ok(it->second);
}

AccountLookup InMemoryUserDirectory::findByUsername(std::string_view username) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, account] : accounts_) {
        if (account.username == username) {
            return AccountLookup::ok(account);
        }
    }
    return AccountLookup::ok(std::nullopt);
}

AccountLookup InMemoryUserDirectory::findByEmail(std::string_view email) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, account] : accounts_) {
        if (account.email == email) {
            return AccountLookup::ok(account);
        }
    }
    return AccountLookup::ok(std::nullopt);
}

WardenResult<AccountId> InMemoryUserDirectory::create(Account account) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (taken(account.username, account.email, AccountId{})) {
        return WardenResult<AccountId>::err(
            WardenError(ErrorCode::AlreadyExists, "username or email already registered"));
    }
    AccountId id(nextId_++);
    account.id = id;
    // Callers with their own clock stamp the record; otherwise stamp it here.
    if (account.createdAt == std::chrono::system_clock::time_point{}) {
        account.createdAt = std::chrono::system_clock::now();
        account.updatedAt = account.createdAt;
    }
    accounts_.emplace(id, std::move(account));
    return WardenResult<AccountId>::ok(id);
}

WardenResult<void> InMemoryUserDirectory::update(const Account& account) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(account.id);
    if (it == accounts_.end()) {
        return WardenResult<void>::err(
            WardenError(ErrorCode::AccountNotFound, "account not found"));
    }
    if (taken(account.username, account.email, account.id)) {
        return WardenResult<void>::err(
            WardenError(ErrorCode::AlreadyExists, "username or email already registered"));
    }
    auto createdAt = it->second.createdAt;
    auto confirmed = it->second.confirmed;
    it->second = account;
    it->second.createdAt = createdAt;
    it->second.confirmed = confirmed;
    return WardenResult<void>::ok();
}

WardenResult<ConfirmTransition> InMemoryUserDirectory::markConfirmed(AccountId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(id);
    if (it == accounts_.end()) {
        return WardenResult<ConfirmTransition>::ok(ConfirmTransition::NotFound);
    }
    if (it->second.confirmed) {
        return WardenResult<ConfirmTransition>::ok(ConfirmTransition::AlreadyConfirmed);
    }
    it->second.confirmed = true;
    it->second.updatedAt = std::chrono::system_clock::now();
    return WardenResult<ConfirmTransition>::ok(ConfirmTransition::Confirmed);
}

std::size_t InMemoryUserDirectory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accounts_.size();
}

bool InMemoryUserDirectory::taken(std::string_view username,
                                  std::string_view email,
                                  AccountId except) const {
    for (const auto& [id, account] : accounts_) {
        if (id == except) {
            continue;
        }
        if (account.username == username || account.email == email) {
            return true;
        }
    }
    return false;
}

} // namespace warden::service
