#pragma once

#include "phasecloud/core/exception.h"
#include <yaml-cpp/yaml.h>
#include <string>
#include <vector>

namespace phasecloud {
namespace core {

/**
 * YAML configuration file
 *
 * Top-level keys mirror the long command-line option names
 * (dimensions, threshold, zlim, mirror, ...).
 */
class Configuration {
public:
    Configuration() = default;

    /**
     * Load configuration from file
     * @throws ConfigException if the file is missing or not valid YAML
     */
    void load(const std::string& filename);

    /**
     * Load configuration from an in-memory YAML document
     */
    void loadFromString(const std::string& yaml);

    void clear();

    bool has(const std::string& key) const;

    /**
     * Top-level keys in document order
     */
    std::vector<std::string> keys() const;

    /**
     * Get value converted to T, or defaultValue when the key is absent
     * @throws ConfigException when the value cannot be converted to T
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue = T{}) const {
        if (!has(key)) {
            return defaultValue;
        }
        try {
            return root_[key].as<T>();
        } catch (const YAML::Exception& e) {
            PHASECLOUD_THROW(ConfigException,
                             "Invalid value for '" + key + "' in " + describeSource() + ": " + e.what());
        }
    }

    /**
     * Get value as the string form of a scalar or a comma-joined sequence
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    std::string getFilename() const { return currentFile_; }

private:
    std::string describeSource() const;

    YAML::Node root_;
    std::string currentFile_;
};

} // namespace core
} // namespace phasecloud
