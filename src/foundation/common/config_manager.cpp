#include "openmelee/foundation/config_manager.hpp"

namespace openmelee::foundation {

GameResult<void> ConfigManager::load(const std::filesystem::path& path) {
    try {
        return replaceRoot(YAML::LoadFile(path.string()));
    } catch (const YAML::BadFile&) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

GameResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    try {
        return replaceRoot(YAML::Load(std::string(yaml)));
    } catch (const YAML::ParserException& e) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

GameResult<void> ConfigManager::replaceRoot(const YAML::Node& root) {
    if (root && !root.IsNull() && !root.IsMap()) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, "config root must be a mapping"));
    }
    std::lock_guard lock(mutex_);
    entries_.clear();
    flatten("", root);
    return GameResult<void>::ok();
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else if (!prefix.empty()) {
        // Leaf node (scalar, sequence, null): store with its dotted key.
        entries_[prefix] = YAML::Clone(node);
    }
}

}  // namespace openmelee::foundation
