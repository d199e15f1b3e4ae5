#pragma once

/// @file auth_config.hpp
/// @brief Building AuthConfig from YAML configuration.
///
/// Keys live under "auth." (see loadAuthConfig).  A key that is absent keeps
/// its AuthConfig default; a key that is present but wrong is an error.

#include "warden/foundation/config_manager.hpp"
#include "warden/foundation/warden_result.hpp"
#include "warden/service/auth_types.hpp"

#include <filesystem>

namespace warden::service {

/// Build an AuthConfig from the auth.* keys of config.
///
/// Recognized keys:
///   signing_key, previous_signing_keys, activation_token_ttl_seconds,
///   session_protection, short_session_seconds, remember_session_seconds,
///   default_landing_path, scrypt_log_n, scrypt_r, scrypt_p,
///   min_password_length, rate_limit_max_attempts, rate_limit_window_seconds
///
/// @return The config, or ConfigTypeMismatch / ConfigInvalidValue.
[[nodiscard]] foundation::WardenResult<AuthConfig> loadAuthConfig(
    const foundation::ConfigManager& config);

/// Check cross-field rules on an AuthConfig, wherever it came from.
[[nodiscard]] foundation::WardenResult<void> validateAuthConfig(const AuthConfig& config);

/// Minimum length in bytes of any signing key.
inline constexpr std::size_t kMinSigningKeyBytes = 32;

/// Load a YAML file into config.  The WARDEN_CONFIG_PATH environment
/// variable, when set, replaces fallbackPath.
foundation::WardenResult<void> loadConfigFile(foundation::ConfigManager& config,
                                              const std::filesystem::path& fallbackPath);

/// Load the configuration a command-line tool runs with: the file after
/// "--config", else the loadConfigFile() choice when WARDEN_CONFIG_PATH is
/// set or defaultPath exists.  Otherwise config stays empty and every
/// AuthConfig default applies.
foundation::WardenResult<void> loadToolConfig(foundation::ConfigManager& config,
                                              int argc,
                                              char* argv[],
                                              const std::filesystem::path& defaultPath);

/// Return the value following "--config" in argv, or an empty path.
std::filesystem::path parseConfigArg(int argc, char* argv[]);

}  // namespace warden::service
