/// @file rate_limiter.cpp
/// @brief Sliding-window RateLimiter implementation.

#include "warden/service/rate_limiter.hpp"

#include "warden/service/clock.hpp"

namespace warden::service {

RateLimiter::RateLimiter(uint32_t maxAttempts,
                         std::chrono::seconds window,
                         std::shared_ptr<const IClock> clock)
    : maxAttempts_(maxAttempts), window_(window), clock_(std::move(clock)) {}

bool RateLimiter::allow(std::string_view key) {
    if (maxAttempts_ == 0) {
        return true;
    }
    auto now = clock_->now();
    std::lock_guard<std::mutex> lock(mutex_);
    auto& timestamps = attempts_[std::string(key)];
    purgeExpired(timestamps, now);
    if (timestamps.size() >= static_cast<std::size_t>(maxAttempts_)) {
        return false;
    }
    timestamps.push_back(now);
    return true;
}

uint32_t RateLimiter::remaining(std::string_view key) const {
    auto now = clock_->now();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = attempts_.find(std::string(key));
    if (it == attempts_.end()) {
        return maxAttempts_;
    }
    auto timestamps = it->second;  // copy to purge
    purgeExpired(timestamps, now);
    auto used = static_cast<uint32_t>(timestamps.size());
    return (used >= maxAttempts_) ? 0u : (maxAttempts_ - used);
}

void RateLimiter::reset(std::string_view key) {
    std::lock_guard<std::mutex> lock(mutex_);
    attempts_.erase(std::string(key));
}

std::size_t RateLimiter::pruneIdle() {
    auto now = clock_->now();
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t dropped = 0;
    for (auto it = attempts_.begin(); it != attempts_.end();) {
        purgeExpired(it->second, now);
        if (it->second.empty()) {
            it = attempts_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    return dropped;
}

void RateLimiter::purgeExpired(std::deque<TimePoint>& timestamps, TimePoint now) const {
    auto cutoff = now - window_;
    while (!timestamps.empty() && timestamps.front() <= cutoff) {
        timestamps.pop_front();
    }
}

}  // namespace warden::service
