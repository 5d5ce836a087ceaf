#include "phasecloud/core/Configuration.hpp"
#include "phasecloud/core/Logger.hpp"
#include <filesystem>

namespace phasecloud {
namespace core {

void Configuration::load(const std::string& filename) {
    if (!std::filesystem::exists(filename)) {
        PHASECLOUD_THROW(ConfigException, "Configuration file not found: " + filename);
    }

    try {
        root_ = YAML::LoadFile(filename);
    } catch (const YAML::Exception& e) {
        PHASECLOUD_THROW(ConfigException,
                         "Failed to parse configuration file " + filename + ": " + e.what());
    }

    if (!root_.IsNull() && !root_.IsMap()) {
        PHASECLOUD_THROW(ConfigException,
                         "Configuration file " + filename + " must contain a mapping of option names");
    }

    currentFile_ = filename;
    PHASECLOUD_LOG_DEBUG("Configuration") << "Loaded " << keys().size()
                                          << " option(s) from " << filename;
}

void Configuration::loadFromString(const std::string& yaml) {
    try {
        root_ = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        PHASECLOUD_THROW(ConfigException, std::string("Failed to parse configuration: ") + e.what());
    }

    if (!root_.IsNull() && !root_.IsMap()) {
        PHASECLOUD_THROW(ConfigException, "Configuration must contain a mapping of option names");
    }
    currentFile_.clear();
}

void Configuration::clear() {
    root_ = YAML::Node();
    currentFile_.clear();
}

bool Configuration::has(const std::string& key) const {
    if (!root_.IsMap()) {
        return false;
    }
    return static_cast<bool>(root_[key]);
}

std::vector<std::string> Configuration::keys() const {
    std::vector<std::string> result;
    if (!root_.IsMap()) {
        return result;
    }
    for (const auto& entry : root_) {
        result.push_back(entry.first.as<std::string>());
    }
    return result;
}

std::string Configuration::getString(const std::string& key, const std::string& defaultValue) const {
    if (!has(key)) {
        return defaultValue;
    }

    const YAML::Node node = root_[key];
    if (node.IsSequence()) {
        std::string joined;
        for (size_t i = 0; i < node.size(); ++i) {
            if (i > 0) {
                joined += ",";
            }
            joined += node[i].as<std::string>();
        }
        return joined;
    }
    return get<std::string>(key, defaultValue);
}

std::string Configuration::describeSource() const {
    return currentFile_.empty() ? std::string("configuration") : currentFile_;
}

} // namespace core
} // namespace phasecloud
