#pragma once

/// @file rate_limiter.hpp
/// @brief Sliding-window throttle for login attempts per client address.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace warden::service {

class IClock;

/// Sliding-window rate limiter driven by the injectable clock.
///
/// Example:
/// @code
///   RateLimiter limiter(5, std::chrono::seconds{60}, clock);
///   if (!limiter.allow(request.client.remoteAddress)) {
///       // LoginOutcome::Throttled
///   }
/// @endcode
class RateLimiter {
public:
    /// A maxAttempts of zero disables throttling.
    RateLimiter(uint32_t maxAttempts,
                std::chrono::seconds window,
                std::shared_ptr<const IClock> clock);

    /// Record an attempt for key. False once the window is full.
    [[nodiscard]] bool allow(std::string_view key);

    /// Attempts left for key in the current window.
    [[nodiscard]] uint32_t remaining(std::string_view key) const;

    /// Forget all attempts for key (called after a successful login).
    void reset(std::string_view key);

    /// Drop keys whose attempts have all aged out. Returns the count dropped.
    std::size_t pruneIdle();

private:
    using TimePoint = std::chrono::system_clock::time_point;

    /// Caller holds mutex_.
    void purgeExpired(std::deque<TimePoint>& timestamps, TimePoint now) const;

    uint32_t maxAttempts_;
    std::chrono::seconds window_;
    std::shared_ptr<const IClock> clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::deque<TimePoint>> attempts_;
};

} // namespace warden::service
