#pragma once

#include <handcad/core/Logger.hpp>
#include <yaml-cpp/yaml.h>
#include <mutex>
#include <string>

namespace handcad {
namespace core {

/**
 * YAML-backed configuration store
 *
 * Values are addressed with dotted keys ("gesture.pinch_threshold").
 * Missing keys and values that do not convert fall back to the caller's
 * default; a conversion failure is logged as a warning.
 */
class Configuration {
public:
    /**
     * Get singleton instance
     */
    static Configuration& getInstance();

    /**
     * Load configuration from a YAML file (replaces current content)
     */
    bool load(const std::string& filename);

    /**
     * Load configuration from a YAML document held in memory
     */
    bool loadFromString(const std::string& yaml);

    /**
     * Reload the last file passed to load()
     */
    bool reload();

    /**
     * Clear all configuration
     */
    void clear();

    /**
     * Check if a dotted key resolves to a value
     */
    bool has(const std::string& key) const;

    /**
     * Get value for a dotted key
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue) const {
        std::lock_guard<std::mutex> lock(mutex_);
        YAML::Node node;
        if (!lookup(key, node) || !node.IsScalar()) {
            return defaultValue;
        }
        try {
            return node.as<T>();
        } catch (const YAML::Exception& e) {
            LOG_WARNING("Configuration: cannot convert '" + key + "' (" + e.what() +
                        "), using default");
            return defaultValue;
        }
    }

    /**
     * Get configuration filename
     */
    std::string getFilename() const;

private:
    Configuration() = default;
    ~Configuration() = default;

    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    bool lookup(const std::string& key, YAML::Node& out) const;

    mutable std::mutex mutex_;
    YAML::Node root_;
    std::string currentFile_;
};

} // namespace core
} // namespace handcad
