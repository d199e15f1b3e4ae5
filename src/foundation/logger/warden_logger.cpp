/// @file warden_logger.cpp
/// @brief WardenLogger implementation over the kcenon logger registry.

#include "warden/foundation/warden_logger.hpp"

// kcenon logger headers (hidden behind PIMPL)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <array>
#include <atomic>
#include <sstream>
#include <string>

namespace warden::foundation {

namespace kci = kcenon::common::interfaces;

// ---------------------------------------------------------------------------
// Level mapping: Warden -> kcenon
// ---------------------------------------------------------------------------
static kci::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

static constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,     // Core
    LogLevel::Info,     // Credential
    LogLevel::Info,     // Token
    LogLevel::Info,     // Activation
    LogLevel::Info,     // Session
    LogLevel::Warning,  // Directory
    LogLevel::Info      // Config
};

static std::string formatContext(const LogContext& ctx) {
    std::ostringstream oss;
    bool first = true;

    auto append = [&](std::string_view key, std::string_view val) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << val;
        first = false;
    };

    if (ctx.accountId && ctx.accountId->isValid()) {
        append("account_id", std::to_string(ctx.accountId->value()));
    }
    if (ctx.sessionId && !ctx.sessionId->empty()) {
        append("session", *ctx.sessionId);
    }
    if (ctx.clientAddress && !ctx.clientAddress->empty()) {
        append("client", *ctx.clientAddress);
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }

    return oss.str();
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct WardenLogger::Impl {
    // Per-category log levels (atomic for lock-free reads on the hot path)
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;

    // Named loggers looked up in GlobalLoggerRegistry, one per category
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i], std::memory_order_relaxed);
            loggerNames[i] = std::string("warden.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    std::shared_ptr<kci::ILogger> getLogger(LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        if (idx >= kLogCategoryCount) {
            return kci::GlobalLoggerRegistry::null_logger();
        }
        // Named logger first, default logger when the name is unregistered.
        auto& registry = kci::GlobalLoggerRegistry::instance();
        auto logger = registry.get_logger(loggerNames[idx]);
        if (logger == kci::GlobalLoggerRegistry::null_logger()) {
            return registry.get_default_logger();
        }
        return logger;
    }

    std::string format(LogCategory cat, std::string_view msg, std::string_view ctx) const {
        // Format: [Category] message {key=val, ...}
        std::string formatted;
        formatted.reserve(msg.size() + ctx.size() + 20);
        formatted += '[';
        formatted += logCategoryName(cat);
        formatted += "] ";
        formatted += msg;
        if (!ctx.empty()) {
            formatted += " {";
            formatted += ctx;
            formatted += '}';
        }
        return formatted;
    }
};

WardenLogger::WardenLogger() : impl_(std::make_unique<Impl>()) {}

WardenLogger::~WardenLogger() = default;

WardenLogger::WardenLogger(WardenLogger&&) noexcept = default;
WardenLogger& WardenLogger::operator=(WardenLogger&&) noexcept = default;

void WardenLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }
    auto logger = impl_->getLogger(cat);
    static_cast<void>(logger->log(mapLevel(level), impl_->format(cat, msg, {})));
}

void WardenLogger::logWithContext(LogLevel level, LogCategory cat,
                                  std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }
    auto logger = impl_->getLogger(cat);
    static_cast<void>(
        logger->log(mapLevel(level), impl_->format(cat, msg, formatContext(ctx))));
}

void WardenLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

LogLevel WardenLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool WardenLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

WardenResult<void> WardenLogger::flush() {
    auto& registry = kci::GlobalLoggerRegistry::instance();
    auto logger = registry.get_default_logger();
    auto result = logger->flush();
    if (result.is_err()) {
        return WardenResult<void>::err(
            WardenError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return WardenResult<void>::ok();
}

WardenLogger& WardenLogger::instance() {
    static WardenLogger inst;
    return inst;
}

} // namespace warden::foundation
