#include "latchkey/foundation/config_manager.hpp"

namespace latchkey::foundation {

AuthResult<void> ConfigManager::load(const std::filesystem::path& path) {
    try {
        return loadNode(YAML::LoadFile(path.string()));
    } catch (const YAML::BadFile&) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

AuthResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    try {
        return loadNode(YAML::Load(std::string(yaml)));
    } catch (const YAML::ParserException& e) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

AuthResult<void> ConfigManager::loadNode(const YAML::Node& root) {
    std::lock_guard lock(mutex_);
    entries_.clear();
    if (root.IsNull()) {
        return AuthResult<void>::ok();
    }
    if (!root.IsMap()) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::ConfigLoadFailed, "config root must be a mapping"));
    }
    flatten("", root);
    return AuthResult<void>::ok();
}

void ConfigManager::watch(std::string_view key, ConfigWatchCallback callback) {
    std::lock_guard lock(mutex_);
    watchers_[std::string(key)].push_back(std::move(callback));
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else {
        // Leaf node (scalar, sequence, null), stored under its dotted key.
        entries_[prefix] = YAML::Clone(node);
    }
}

void ConfigManager::notifyWatchers(std::string_view key) {
    std::vector<ConfigWatchCallback> callbacks;
    {
        std::lock_guard lock(mutex_);
        auto it = watchers_.find(std::string(key));
        if (it == watchers_.end()) {
            return;
        }
        callbacks = it->second;
    }
    for (auto& cb : callbacks) {
        cb(key);
    }
}

}  // namespace latchkey::foundation
