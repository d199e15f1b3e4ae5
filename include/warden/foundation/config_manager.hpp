#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration management with typed access.

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include <yaml-cpp/yaml.h>

#include "warden/foundation/warden_result.hpp"

namespace warden::foundation {

/// YAML-based configuration manager providing typed access to config values.
///
/// Supports loading from file, dotted-key access (e.g., "auth.signing_key")
/// and setting values at runtime. Internally flattens the YAML tree into a
/// key-value map to avoid yaml-cpp reference-semantic pitfalls. Sequences
/// are kept whole under their key.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing any loaded entries.
    /// @return Success or ConfigLoadFailed error.
    WardenResult<void> load(const std::filesystem::path& path);

    /// Load configuration from an in-memory YAML document.
    WardenResult<void> loadString(std::string_view yaml);

    /// Retrieve a typed value by dotted key (e.g., "auth.scrypt_log_n").
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch error.
    template <typename T>
    WardenResult<T> get(std::string_view key) const;

    /// Set a value by dotted key.
    template <typename T>
    void set(std::string_view key, const T& value);

    /// Check if a key exists in the current configuration.
    [[nodiscard]] bool hasKey(std::string_view key) const;

private:
    /// Flatten a YAML node recursively into the entries_ map.
    void flatten(const std::string& prefix, const YAML::Node& node);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
};

// --- Template implementations ---

template <typename T>
WardenResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return WardenResult<T>::err(
            WardenError(ErrorCode::ConfigKeyNotFound,
                        std::string("config key not found: ") + std::string(key)));
    }
    try {
        return WardenResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return WardenResult<T>::err(
            WardenError(ErrorCode::ConfigTypeMismatch,
                        std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    std::lock_guard lock(mutex_);
    entries_[std::string(key)] = YAML::Node(value);
}

} // namespace warden::foundation
