#pragma once

/// @file config_manager.hpp
/// @brief Engine settings read from YAML, addressed by dotted keys.

#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "dqe/foundation/game_result.hpp"

namespace dqe::foundation {

/// Leaf values of a YAML document keyed by their dotted path.
///
/// @code
///   combat:
///     flee_chance: 0.4     ->  "combat.flee_chance" = 0.4
///   logging:
///     skill: warn          ->  "logging.skill" = "warn"
/// @endcode
///
/// Sequences are leaves.  Every successful load discards the previous
/// entries; a failed load leaves them untouched.
class ConfigManager {
public:
    ConfigManager() = default;

    /// ConfigLoadFailed when the file is missing, malformed, or its root
    /// is not a mapping.
    GameResult<void> load(const std::filesystem::path& path);

    GameResult<void> loadFromString(std::string_view yaml);

    /// ConfigKeyNotFound or ConfigTypeMismatch on failure.
    template <typename T>
    GameResult<T> get(std::string_view key) const;

    /// Like get(), but a missing key yields @p fallback.
    template <typename T>
    GameResult<T> getOr(std::string_view key, T fallback) const;

    template <typename T>
    void set(std::string_view key, const T& value) {
        entries_.insert_or_assign(std::string(key), YAML::Node(value));
    }

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// Sorted full keys directly or indirectly below @p section.
    [[nodiscard]] std::vector<std::string> keysUnder(std::string_view section) const;

private:
    using Entries = std::map<std::string, YAML::Node, std::less<>>;

    GameResult<void> adopt(const YAML::Node& root, std::string_view origin);
    static void collect(Entries& out, const std::string& path, const YAML::Node& node);

    template <typename T>
    static GameResult<T> convert(std::string_view key, const YAML::Node& node);

    Entries entries_;
};

template <typename T>
GameResult<T> ConfigManager::convert(std::string_view key, const YAML::Node& node) {
    try {
        return GameResult<T>::ok(node.as<T>());
    } catch (const YAML::BadConversion&) {
        std::string msg = "config key '";
        msg.append(key).append("' has an unexpected type");
        return GameResult<T>::err(GameError(ErrorCode::ConfigTypeMismatch, std::move(msg)));
    }
}

template <typename T>
GameResult<T> ConfigManager::get(std::string_view key) const {
    auto entry = entries_.find(key);
    if (entry == entries_.end()) {
        std::string msg = "config key '";
        msg.append(key).append("' is not set");
        return GameResult<T>::err(GameError(ErrorCode::ConfigKeyNotFound, std::move(msg)));
    }
    return convert<T>(key, entry->second);
}

template <typename T>
GameResult<T> ConfigManager::getOr(std::string_view key, T fallback) const {
    auto entry = entries_.find(key);
    if (entry == entries_.end()) {
        return GameResult<T>::ok(std::move(fallback));
    }
    return convert<T>(key, entry->second);
}

} // namespace dqe::foundation
