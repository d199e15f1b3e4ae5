#pragma once

/// @file activation_mailer.hpp
/// @brief Hand-off point for delivering activation tokens to users.

#include <string_view>

namespace warden::service {

/// Delivers an activation token to an email address.
///
/// Fire-and-forget: delivery failures are the implementation's to log or
/// retry, and never affect registration.
class IActivationMailer {
public:
    virtual ~IActivationMailer() = default;

    virtual void deliver(std::string_view email, std::string_view token) = 0;
};

/// Development mailer that only logs the hand-off.  The token itself is not
/// logged, just its length.
class LoggingActivationMailer : public IActivationMailer {
public:
    void deliver(std::string_view email, std::string_view token) override;
};

}  // namespace warden::service
