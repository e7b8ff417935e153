#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration with typed, dotted-key access.

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "gre/foundation/rating_result.hpp"

namespace gre::foundation {

/// YAML configuration store providing typed access to config values.
///
/// The YAML tree is flattened into dotted keys on load, so
/// @code
///   rating:
///     tau: 0.5
/// @endcode
/// is read back with `get<double>("rating.tau")`.
///
/// The rating core never reads configuration itself; ConfigManager only
/// feeds rating::loadSettings().
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    /// @return Success or ConfigLoadFailed error.
    RatingResult<void> load(const std::filesystem::path& path);

    /// Load configuration from an in-memory YAML document.
    /// @return Success or ConfigLoadFailed error.
    RatingResult<void> loadString(std::string_view yaml);

    /// Retrieve a typed value by dotted key.
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch error.
    template <typename T>
    RatingResult<T> get(std::string_view key) const;

    /// Set a leaf value by dotted key.
    template <typename T>
    void set(std::string_view key, const T& value);

    /// Check if a key exists in the current configuration.
    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// All flattened keys, sorted.
    [[nodiscard]] std::vector<std::string> keys() const;

private:
    /// Replace entries_ with the flattened form of root. Caller holds mutex_.
    void replaceEntries(const YAML::Node& root);

    /// Flatten a YAML node recursively into `out`.
    static void flatten(const std::string& prefix, const YAML::Node& node,
                        std::unordered_map<std::string, YAML::Node>& out);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
};

// --- Template implementations ---

template <typename T>
RatingResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return RatingResult<T>::err(
            RatingError(ErrorCode::ConfigKeyNotFound,
                        std::string("config key not found: ") + std::string(key)));
    }
    try {
        return RatingResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return RatingResult<T>::err(
            RatingError(ErrorCode::ConfigTypeMismatch,
                        std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    std::lock_guard lock(mutex_);
    entries_[std::string(key)] = YAML::Node(value);
}

} // namespace gre::foundation
