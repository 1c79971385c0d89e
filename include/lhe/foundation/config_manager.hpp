#pragma once

/// @file config_manager.hpp
/// @brief YAML-backed configuration with dotted-key typed access.

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "lhe/foundation/game_result.hpp"

namespace lhe::foundation {

/// YAML configuration flattened into dotted keys.
///
/// Maps are flattened ("reactions.armour.factor"); sequences and scalars are
/// stored as leaves, so a sequence such as the reaction rule list is fetched
/// whole with get<YAML::Node>("reactions").
///
/// Every yaml-cpp exception is caught here and reported as a GameError.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing the current contents.
    /// @return ConfigLoadFailed when the file is missing or malformed.
    GameResult<void> load(const std::filesystem::path& path);

    /// Load configuration from an in-memory YAML document.
    GameResult<void> loadString(std::string_view yaml);

    /// Typed value by dotted key.
    /// @return ConfigKeyNotFound or ConfigTypeMismatch on failure.
    template <typename T>
    GameResult<T> get(std::string_view key) const;

    /// Typed value by dotted key, or @p fallback when absent.
    /// A present value of the wrong type is still a ConfigTypeMismatch.
    template <typename T>
    GameResult<T> getOr(std::string_view key, T fallback) const;

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// Keys directly below @p prefix ("segments" -> {"knight", "drone"}).
    [[nodiscard]] std::vector<std::string> childKeys(std::string_view prefix) const;

private:
    GameResult<void> replaceWith(const YAML::Node& root);
    void flatten(const std::string& prefix, const YAML::Node& node);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
};

template <typename T>
GameResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return GameResult<T>::err(
            GameError(ErrorCode::ConfigKeyNotFound,
                      "config key not found: " + std::string(key)));
    }
    try {
        return GameResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return GameResult<T>::err(
            GameError(ErrorCode::ConfigTypeMismatch,
                      "type mismatch for key: " + std::string(key)));
    }
}

template <typename T>
GameResult<T> ConfigManager::getOr(std::string_view key, T fallback) const {
    if (!hasKey(key)) {
        return GameResult<T>::ok(std::move(fallback));
    }
    return get<T>(key);
}

} // namespace lhe::foundation
