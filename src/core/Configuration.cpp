#include "handcad/core/Configuration.hpp"
#include "handcad/core/exception.h"
#include <sstream>

namespace handcad {
namespace core {

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::load(const std::string& filename) {
    YAML::Node parsed;
    try {
        parsed = YAML::LoadFile(filename);
    } catch (const YAML::Exception& e) {
        LOG_ERROR("Configuration: failed to load " + filename + ": " + e.what());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    root_.reset(parsed);
    currentFile_ = filename;
    LOG_INFO("Configuration loaded from " + filename);
    return true;
}

bool Configuration::loadFromString(const std::string& yaml) {
    YAML::Node parsed;
    try {
        parsed = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        LOG_ERROR(std::string("Configuration: failed to parse document: ") + e.what());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    root_.reset(parsed);
    currentFile_.clear();
    return true;
}

bool Configuration::reload() {
    std::string filename = getFilename();
    if (filename.empty()) {
        LOG_WARNING("Configuration: reload requested but no file was loaded");
        return false;
    }
    return load(filename);
}

void Configuration::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    root_.reset();
    currentFile_.clear();
}

bool Configuration::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    YAML::Node node;
    return lookup(key, node);
}

std::string Configuration::getFilename() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentFile_;
}

bool Configuration::lookup(const std::string& key, YAML::Node& out) const {
    if (key.empty()) {
        return false;
    }

    YAML::Node current = root_;
    std::stringstream parts(key);
    std::string part;

    while (std::getline(parts, part, '.')) {
        if (part.empty() || !current.IsMap()) {
            return false;
        }
        const YAML::Node& parent = current;
        YAML::Node next = parent[part];
        if (!next.IsDefined() || next.IsNull()) {
            return false;
        }
        // reset() rebinds; operator= would overwrite the parent's content
        current.reset(next);
    }

    out.reset(current);
    return true;
}

LoggingConfig LoggingConfig::from_configuration(const Configuration& configuration) {
    LoggingConfig config;
    config.level = logLevelFromString(configuration.get<std::string>("logging.level", "INFO"));
    config.console = configuration.get<bool>("logging.console", config.console);
    config.file = configuration.get<std::string>("logging.file", config.file);
    config.directory = configuration.get<std::string>("logging.directory", config.directory);

    if (!config.is_valid()) {
        HANDCAD_THROW(ConfigurationException, "logging.file is \"auto\" but logging.directory is empty");
    }
    return config;
}

} // namespace core
} // namespace handcad
