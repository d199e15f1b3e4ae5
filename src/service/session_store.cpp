/// @file session_store.cpp
/// @brief InMemorySessionStore implementation.

#include "warden/service/session_store.hpp"

namespace warden::service {

void InMemorySessionStore::create(SessionRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto key = record.token;
    sessions_.insert_or_assign(std::move(key), std::move(record));
}

std::optional<SessionRecord> InMemorySessionStore::find(std::string_view token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(std::string(token));
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool InMemorySessionStore::update(const SessionRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(record.token);
    if (it == sessions_.end()) {
        return false;
    }
    it->second = record;
    return true;
}

bool InMemorySessionStore::destroy(std::string_view token) {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.erase(std::string(token)) > 0;
}

std::size_t InMemorySessionStore::destroyAllForAccount(AccountId accountId) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (it->second.accountId == accountId) {
            it = sessions_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t InMemorySessionStore::removeExpired(std::chrono::system_clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (it->second.expiresAt <= now) {
            it = sessions_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t InMemorySessionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace warden::service
