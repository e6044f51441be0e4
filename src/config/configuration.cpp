// File: config/configuration.cpp

#include "config/configuration.hpp"

namespace config {

    std::shared_ptr<Configuration> Configuration::instance_;
    std::once_flag Configuration::init_flag_;

    void Configuration::initialize(const std::string &filename) { getInstance(filename); }

    Configuration &Configuration::getInstance(const std::string &filename) {
        std::call_once(init_flag_, [&filename] {
            instance_ = std::make_shared<Configuration>(filename.empty() ? std::string(default_filename_) : filename);
        });
        return *instance_;
    }

    Configuration::Configuration(const std::string &filename) : filename_(filename) { loadFile(); }

    void Configuration::reload() {
        std::unique_lock lock(mutex_);
        config_map_.clear();
        loadFile();
    }

    void Configuration::loadFile() {
        LOG_INFO("Loading configuration from file: {}", filename_);

        try {
            const YAML::Node root = YAML::LoadFile(filename_);
            load(root);
            LOG_INFO("Configuration file '{}' loaded successfully ({} keys).", filename_, config_map_.size());
        } catch (const YAML::Exception &e) {
            LOG_CRITICAL("YAML exception while loading configuration '{}': {}", filename_, e.what());
            throw std::runtime_error("Failed to load configuration '" + filename_ + "': " + e.what());
        }
    }

    void Configuration::load(const YAML::Node &node, const std::string &prefix) {
        if (!node.IsMap()) {
            if (node.IsDefined() && !node.IsNull()) {
                LOG_WARN("Configuration root of '{}' is not a map, ignoring it", filename_);
            }
            return;
        }

        for (const auto &it: node) {
            std::string key = prefix.empty() ? it.first.as<std::string>() : prefix + "." + it.first.as<std::string>();
            if (it.second.IsMap()) {
                load(it.second, key);
            } else {
                config_map_[key] = it.second;
                LOG_TRACE("Loaded key: '{}', value: '{}'", key,
                          it.second.IsScalar() ? it.second.as<std::string>() : "[non-scalar]");
            }
        }
    }

    void Configuration::show() const {
        std::shared_lock lock(mutex_);
        LOG_INFO("Configuration details ({}):", filename_);
        for (const auto &[key, value]: config_map_) {
            if (value.IsScalar()) {
                LOG_INFO("{}: {}", key, value.as<std::string>());
            } else {
                LOG_INFO("{}: [non-scalar]", key);
            }
        }
    }
}
