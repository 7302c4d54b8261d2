/// @file config_manager.cpp
/// @brief YAML parsing and key flattening for ConfigManager.

#include "dqe/foundation/config_manager.hpp"

#include "dqe/foundation/game_logger.hpp"

namespace dqe::foundation {

namespace {

GameError loadFailure(std::string_view origin, std::string_view reason) {
    std::string msg(origin);
    msg.append(": ").append(reason);
    return GameError(ErrorCode::ConfigLoadFailed, std::move(msg));
}

} // namespace

GameResult<void> ConfigManager::load(const std::filesystem::path& path) {
    const std::string origin = path.string();
    YAML::Node root;
    try {
        root = YAML::LoadFile(origin);
    } catch (const YAML::BadFile&) {
        return GameResult<void>::err(loadFailure(origin, "cannot open file"));
    } catch (const YAML::ParserException& e) {
        return GameResult<void>::err(loadFailure(origin, e.what()));
    }

    auto adopted = adopt(root, origin);
    if (adopted) {
        DQE_LOG_INFO(LogCategory::Config,
                     "configuration loaded from " + origin + " (" +
                         std::to_string(entries_.size()) + " keys)");
    }
    return adopted;
}

GameResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml));
    } catch (const YAML::ParserException& e) {
        return GameResult<void>::err(loadFailure("<inline>", e.what()));
    }
    return adopt(root, "<inline>");
}

GameResult<void> ConfigManager::adopt(const YAML::Node& root, std::string_view origin) {
    // An empty document is a valid, empty configuration.
    if (!root.IsDefined() || root.IsNull()) {
        entries_.clear();
        return GameResult<void>::ok();
    }
    if (!root.IsMap()) {
        return GameResult<void>::err(loadFailure(origin, "top level is not a mapping"));
    }

    Entries fresh;
    try {
        for (const auto& child : root) {
            collect(fresh, child.first.as<std::string>(), child.second);
        }
    } catch (const YAML::BadConversion&) {
        return GameResult<void>::err(loadFailure(origin, "mapping key is not a scalar"));
    }
    entries_ = std::move(fresh);
    return GameResult<void>::ok();
}

void ConfigManager::collect(Entries& out, const std::string& path, const YAML::Node& node) {
    if (!node.IsMap()) {
        out.insert_or_assign(path, YAML::Clone(node));
        return;
    }
    for (const auto& child : node) {
        collect(out, path + "." + child.first.as<std::string>(), child.second);
    }
}

bool ConfigManager::hasKey(std::string_view key) const {
    return entries_.find(key) != entries_.end();
}

std::vector<std::string> ConfigManager::keysUnder(std::string_view section) const {
    std::string prefix(section);
    prefix.push_back('.');

    std::vector<std::string> keys;
    for (auto it = entries_.lower_bound(prefix); it != entries_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) {
            break;
        }
        keys.push_back(it->first);
    }
    return keys;
}

} // namespace dqe::foundation
