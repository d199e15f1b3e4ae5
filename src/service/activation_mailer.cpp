/// @file activation_mailer.cpp
/// @brief LoggingActivationMailer implementation.

#include "warden/service/activation_mailer.hpp"

#include "warden/foundation/warden_logger.hpp"

#include <string>

namespace warden::service {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

void LoggingActivationMailer::deliver(std::string_view email, std::string_view token) {
    LogContext ctx;
    ctx.extra["email"] = std::string(email);
    ctx.extra["token_length"] = std::to_string(token.size());
    WARDEN_LOG_CTX(LogLevel::Info, LogCategory::Activation, "Activation token handed off", ctx);
}

}  // namespace warden::service
