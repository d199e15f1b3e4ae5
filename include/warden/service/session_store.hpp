#pragma once

/// @file session_store.hpp
/// @brief Session persistence interface and in-memory implementation.

#include "warden/service/auth_types.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace warden::service {

/// Abstract interface for session persistence.
///
/// Implementations must be thread-safe when shared across threads.
class ISessionStore {
public:
    virtual ~ISessionStore() = default;

    /// Store a new session record keyed by its token.
    virtual void create(SessionRecord record) = 0;

    /// Find a session by its token.
    [[nodiscard]] virtual std::optional<SessionRecord> find(std::string_view token) const = 0;

    /// Replace a stored session. Returns false if it no longer exists.
    virtual bool update(const SessionRecord& record) = 0;

    /// Remove a session. Returns false if not found.
    virtual bool destroy(std::string_view token) = 0;

    /// Remove every session belonging to an account. Returns the count removed.
    virtual std::size_t destroyAllForAccount(AccountId accountId) = 0;

    /// Remove sessions whose expiry is at or before now. Returns the count removed.
    virtual std::size_t removeExpired(std::chrono::system_clock::time_point now) = 0;
};

/// Thread-safe in-memory session store for testing and development.
class InMemorySessionStore : public ISessionStore {
public:
    void create(SessionRecord record) override;

    [[nodiscard]] std::optional<SessionRecord> find(std::string_view token) const override;

    bool update(const SessionRecord& record) override;

    bool destroy(std::string_view token) override;

    std::size_t destroyAllForAccount(AccountId accountId) override;

    std::size_t removeExpired(std::chrono::system_clock::time_point now) override;

    /// Number of live records.
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, SessionRecord> sessions_;
};

}  // namespace warden::service
