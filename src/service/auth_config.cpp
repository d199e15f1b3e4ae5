/// @file auth_config.cpp
/// @brief AuthConfig loading and validation.

#include "warden/service/auth_config.hpp"

#include "warden/foundation/warden_logger.hpp"
#include "warden/service/credential_hasher.hpp"
#include "warden/service/session_authenticator.hpp"

#include <cstdlib>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace warden::service {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::WardenError;
using foundation::WardenResult;

namespace {

WardenError invalidValue(std::string_view key, std::string_view why) {
    return WardenError(ErrorCode::ConfigInvalidValue,
                       "auth." + std::string(key) + ": " + std::string(why));
}

/// Read auth.<key> into out.  Absent keys leave out untouched.
template <typename T>
WardenResult<void> readKey(const ConfigManager& config, std::string_view key, T& out) {
    auto value = config.get<T>("auth." + std::string(key));
    if (value) {
        out = std::move(value).value();
        return WardenResult<void>::ok();
    }
    if (value.error().code() == ErrorCode::ConfigKeyNotFound) {
        return WardenResult<void>::ok();
    }
    return WardenResult<void>::err(value.error());
}

/// Read a whole-second duration that must be positive.
WardenResult<void> readSeconds(const ConfigManager& config,
                               std::string_view key,
                               std::chrono::seconds& out) {
    long long seconds = out.count();
    auto read = readKey(config, key, seconds);
    if (!read) {
        return read;
    }
    if (seconds <= 0) {
        return WardenResult<void>::err(invalidValue(key, "must be a positive number of seconds"));
    }
    if (seconds > kMaxLifetime.count()) {
        return WardenResult<void>::err(invalidValue(key, "exceeds the longest supported lifetime"));
    }
    out = std::chrono::seconds(seconds);
    return WardenResult<void>::ok();
}

/// WARDEN_CONFIG_PATH when set and non-empty.
std::optional<std::filesystem::path> envConfigPath() {
    const char* envPath = std::getenv("WARDEN_CONFIG_PATH");
    if (envPath == nullptr || *envPath == '\0') {
        return std::nullopt;
    }
    return std::filesystem::path(envPath);
}

}  // anonymous namespace

std::optional<SessionProtection> parseSessionProtection(std::string_view name) {
    for (auto level : {SessionProtection::None, SessionProtection::Basic, SessionProtection::Strong}) {
        if (name == sessionProtectionName(level)) {
            return level;
        }
    }
    return std::nullopt;
}

WardenResult<AuthConfig> loadAuthConfig(const ConfigManager& config) {
    AuthConfig cfg;
    std::string protection(sessionProtectionName(cfg.sessionProtection));

    WardenResult<void> steps[] = {
        readKey(config, "signing_key", cfg.signingKey),
        readKey(config, "previous_signing_keys", cfg.previousSigningKeys),
        readSeconds(config, "activation_token_ttl_seconds", cfg.activationTokenTtl),
        readKey(config, "session_protection", protection),
        readSeconds(config, "short_session_seconds", cfg.shortSessionLifetime),
        readSeconds(config, "remember_session_seconds", cfg.rememberSessionLifetime),
        readKey(config, "default_landing_path", cfg.defaultLandingPath),
        readKey(config, "scrypt_log_n", cfg.scryptLogN),
        readKey(config, "scrypt_r", cfg.scryptR),
        readKey(config, "scrypt_p", cfg.scryptP),
        readKey(config, "min_password_length", cfg.minPasswordLength),
        readKey(config, "rate_limit_max_attempts", cfg.rateLimitMaxAttempts),
        readSeconds(config, "rate_limit_window_seconds", cfg.rateLimitWindow),
    };
    for (const auto& step : steps) {
        if (!step) {
            return WardenResult<AuthConfig>::err(step.error());
        }
    }

    auto level = parseSessionProtection(protection);
    if (!level) {
        return WardenResult<AuthConfig>::err(
            invalidValue("session_protection", "expected none, basic or strong"));
    }
    cfg.sessionProtection = *level;

    auto valid = validateAuthConfig(cfg);
    if (!valid) {
        return WardenResult<AuthConfig>::err(valid.error());
    }

    if (cfg.sessionProtection == SessionProtection::None) {
        WARDEN_LOG_WARN(LogCategory::Config,
                        "Session protection is 'none'; sessions are never re-checked");
    }
    return WardenResult<AuthConfig>::ok(std::move(cfg));
}

WardenResult<void> validateAuthConfig(const AuthConfig& config) {
    if (config.signingKey.size() < kMinSigningKeyBytes) {
        return WardenResult<void>::err(
            invalidValue("signing_key", "must be at least 32 bytes"));
    }
    for (const auto& key : config.previousSigningKeys) {
        if (key.size() < kMinSigningKeyBytes) {
            return WardenResult<void>::err(
                invalidValue("previous_signing_keys", "every key must be at least 32 bytes"));
        }
    }
    const std::pair<std::string_view, std::chrono::seconds> lifetimes[] = {
        {"activation_token_ttl_seconds", config.activationTokenTtl},
        {"short_session_seconds", config.shortSessionLifetime},
        {"remember_session_seconds", config.rememberSessionLifetime},
        {"rate_limit_window_seconds", config.rateLimitWindow},
    };
    for (const auto& [key, value] : lifetimes) {
        if (value.count() <= 0 || value > kMaxLifetime) {
            return WardenResult<void>::err(invalidValue(key, "out of range"));
        }
    }
    if (!CredentialHasher::withinBounds({config.scryptLogN, config.scryptR, config.scryptP})) {
        return WardenResult<void>::err(
            invalidValue("scrypt_log_n", "scrypt parameters out of bounds"));
    }
    if (!SessionAuthenticator::isSafeRedirect(config.defaultLandingPath)) {
        return WardenResult<void>::err(
            invalidValue("default_landing_path", "must be a relative path starting with '/'"));
    }
    return WardenResult<void>::ok();
}

WardenResult<void> loadConfigFile(ConfigManager& config, const std::filesystem::path& fallbackPath) {
    auto configPath = envConfigPath().value_or(fallbackPath);
    auto loaded = config.load(configPath);
    if (!loaded) {
        WARDEN_LOG_ERROR(LogCategory::Config, "Failed to load " + configPath.string());
    }
    return loaded;
}

WardenResult<void> loadToolConfig(ConfigManager& config,
                                  int argc,
                                  char* argv[],
                                  const std::filesystem::path& defaultPath) {
    auto explicitPath = parseConfigArg(argc, argv);
    if (!explicitPath.empty()) {
        return config.load(explicitPath);
    }
    std::error_code ec;
    if (envConfigPath() || std::filesystem::exists(defaultPath, ec)) {
        return loadConfigFile(config, defaultPath);
    }
    WARDEN_LOG_INFO(LogCategory::Config, "No configuration file; using built-in defaults");
    return WardenResult<void>::ok();
}

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

}  // namespace warden::service
