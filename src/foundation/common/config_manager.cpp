#include "gre/foundation/config_manager.hpp"

#include <algorithm>

#include "gre/foundation/rating_logger.hpp"

namespace gre::foundation {

RatingResult<void> ConfigManager::load(const std::filesystem::path& path) {
    std::lock_guard lock(mutex_);
    try {
        replaceEntries(YAML::LoadFile(path.string()));
    } catch (const YAML::BadFile&) {
        return RatingResult<void>::err(
            RatingError(ErrorCode::ConfigLoadFailed,
                        "failed to open config file: " + path.string()));
    } catch (const YAML::Exception& e) {
        return RatingResult<void>::err(
            RatingError(ErrorCode::ConfigLoadFailed,
                        std::string("YAML parse error: ") + e.what()));
    }
    GRE_LOG_INFO(LogCategory::Config, "loaded configuration from " + path.string());
    return RatingResult<void>::ok();
}

RatingResult<void> ConfigManager::loadString(std::string_view yaml) {
    std::lock_guard lock(mutex_);
    try {
        replaceEntries(YAML::Load(std::string(yaml)));
    } catch (const YAML::Exception& e) {
        return RatingResult<void>::err(
            RatingError(ErrorCode::ConfigLoadFailed,
                        std::string("YAML parse error: ") + e.what()));
    }
    return RatingResult<void>::ok();
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.contains(std::string(key));
}

std::vector<std::string> ConfigManager::keys() const {
    std::vector<std::string> result;
    {
        std::lock_guard lock(mutex_);
        result.reserve(entries_.size());
        for (const auto& [key, node] : entries_) {
            result.push_back(key);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

void ConfigManager::replaceEntries(const YAML::Node& root) {
    // Flatten into a scratch map so a throwing node leaves entries_ intact.
    std::unordered_map<std::string, YAML::Node> flattened;
    if (root.IsMap()) {
        flatten("", root, flattened);
    }
    entries_.swap(flattened);
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node,
                            std::unordered_map<std::string, YAML::Node>& out) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second, out);
        }
    } else {
        // Scalars, sequences and nulls are stored under their dotted key.
        out[prefix] = YAML::Clone(node);
    }
}

}  // namespace gre::foundation
