#pragma once

/// @file warden_logger.hpp
/// @brief WardenLogger wrapping the kcenon logger interfaces for
///        category-based structured logging.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "warden/foundation/types.hpp"
#include "warden/foundation/warden_result.hpp"

namespace warden::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally:
///   Trace -> trace, Debug -> debug, Info -> info, Warning -> warning,
///   Error -> error, Critical -> critical, Off -> off
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories for structured filtering.
enum class LogCategory : uint8_t {
    Core       = 0, ///< Startup, wiring, tools
    Credential = 1, ///< Password hashing and verification
    Token      = 2, ///< Token signing and redemption
    Activation = 3, ///< Account activation
    Session    = 4, ///< Login, logout, principal resolution
    Directory  = 5, ///< Account storage
    Config     = 6  ///< Configuration loading
};

/// Total number of log categories.
inline constexpr std::size_t kLogCategoryCount = 7;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Credential", "Token", "Activation", "Session", "Directory", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

/// Return the string name for a log level.
constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured context data attached to log entries.
///
/// Never put passwords, password hashes or complete tokens in here.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.accountId = AccountId(42);
///   ctx.extra["reason"] = "expired";
///   logger.logWithContext(LogLevel::Info, LogCategory::Activation,
///                         "Activation token rejected", ctx);
/// @endcode
struct LogContext {
    std::optional<AccountId> accountId;
    std::optional<std::string> sessionId;      ///< Short prefix only.
    std::optional<std::string> clientAddress;
    std::unordered_map<std::string, std::string> extra;
};

/// Logger wrapping kcenon's logging interfaces.
///
/// Provides category-based filtering, structured logging with context,
/// and per-category runtime log level control. Uses PIMPL to hide
/// kcenon implementation details from the public API.
///
/// Default log levels per category:
/// | Category   | Default Level |
/// |------------|---------------|
/// | Core       | Info          |
/// | Credential | Info          |
/// | Token      | Info          |
/// | Activation | Info          |
/// | Session    | Info          |
/// | Directory  | Warning       |
/// | Config     | Info          |
class WardenLogger {
public:
    WardenLogger();
    ~WardenLogger();

    // Non-copyable, movable.
    WardenLogger(const WardenLogger&) = delete;
    WardenLogger& operator=(const WardenLogger&) = delete;
    WardenLogger(WardenLogger&&) noexcept;
    WardenLogger& operator=(WardenLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context data.
    /// Context fields are appended as key-value pairs to the log message.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    /// Set the minimum log level for a category at runtime.
    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Get the current minimum log level for a category.
    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    /// Check if logging is enabled for the given level and category.
    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    WardenResult<void> flush();

    /// Get the global WardenLogger singleton instance.
    static WardenLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace warden::foundation

// ---------------------------------------------------------------------------
// Convenience macros (global scope)
// ---------------------------------------------------------------------------

/// @name WARDEN_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// WARDEN_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef WARDEN_MIN_LOG_LEVEL
    #define WARDEN_MIN_LOG_LEVEL 0
#endif

#define WARDEN_LOG(level, cat, msg)                                                   \
    do {                                                                              \
        _Pragma("GCC diagnostic push")                                                \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                           \
        if (static_cast<int>(level) >= WARDEN_MIN_LOG_LEVEL &&                        \
            ::warden::foundation::WardenLogger::instance().isEnabled((level), (cat)))  \
        {                                                                             \
            ::warden::foundation::WardenLogger::instance().log((level), (cat), (msg)); \
        }                                                                             \
        _Pragma("GCC diagnostic pop")                                                 \
    } while (0)

#define WARDEN_LOG_CTX(level, cat, msg, ctx)                                          \
    do {                                                                              \
        if (static_cast<int>(level) >= WARDEN_MIN_LOG_LEVEL) {                        \
            ::warden::foundation::WardenLogger::instance().logWithContext(            \
                (level), (cat), (msg), (ctx));                                        \
        }                                                                             \
    } while (0)

#define WARDEN_LOG_DEBUG(cat, msg) \
    WARDEN_LOG(::warden::foundation::LogLevel::Debug, (cat), (msg))

#define WARDEN_LOG_INFO(cat, msg) \
    WARDEN_LOG(::warden::foundation::LogLevel::Info, (cat), (msg))

#define WARDEN_LOG_WARN(cat, msg) \
    WARDEN_LOG(::warden::foundation::LogLevel::Warning, (cat), (msg))

#define WARDEN_LOG_ERROR(cat, msg) \
    WARDEN_LOG(::warden::foundation::LogLevel::Error, (cat), (msg))

/// @}
