#pragma once

/// @file clock.hpp
/// @brief Injectable wall-clock source for token expiry and session checks.

#include <atomic>
#include <chrono>

namespace warden::service {

/// Abstract source of the current time.
///
/// Implementations must be thread-safe.
class IClock {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    virtual ~IClock() = default;

    /// Current wall-clock time.
    [[nodiscard]] virtual TimePoint now() const = 0;
};

/// Clock backed by std::chrono::system_clock.
class SystemClock : public IClock {
public:
    [[nodiscard]] TimePoint now() const override { return std::chrono::system_clock::now(); }
};

/// Manually driven clock for deterministic tests and replay tooling.
///
/// Example:
/// @code
///   auto clock = std::make_shared<ManualClock>();
///   auto token = signer.issue(payload, std::chrono::seconds{60});
///   clock->advance(std::chrono::seconds{61});
///   // signer.redeem(token) now reports TokenError::Expired
/// @endcode
class ManualClock : public IClock {
public:
    /// Starts at the current system time truncated to whole seconds.
    ManualClock()
        : ticks_(std::chrono::duration_cast<std::chrono::seconds>(
                     std::chrono::system_clock::now().time_since_epoch())
                     .count()) {}

    explicit ManualClock(TimePoint start)
        : ticks_(std::chrono::duration_cast<std::chrono::seconds>(start.time_since_epoch())
                     .count()) {}

    [[nodiscard]] TimePoint now() const override {
        return TimePoint(std::chrono::seconds(ticks_.load(std::memory_order_acquire)));
    }

    /// Move the clock forward by the given duration.
    void advance(std::chrono::seconds delta) {
        ticks_.fetch_add(delta.count(), std::memory_order_acq_rel);
    }

    /// Jump to an absolute time (whole seconds).
    void set(TimePoint tp) {
        ticks_.store(
            std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count(),
            std::memory_order_release);
    }

private:
    std::atomic<std::chrono::seconds::rep> ticks_;
};

}  // namespace warden::service
