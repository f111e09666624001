// =================================================================
// src/ContextStudio/StudioConfig.cpp
// =================================================================
// Implementation for configuration loading with yaml-cpp.

#include "ContextStudio/StudioConfig.hpp"
#include "ContextStudio/CliParser.hpp"
#include "ContextStudio/FileScanner.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <stdexcept>

namespace ContextStudio {

namespace {

bool applyYaml(StudioConfig& config, const YAML::Node& root, Logger& logger) {
    if (!root || root.IsNull()) {
        return true; // Empty file, keep defaults
    }
    if (!root.IsMap()) {
        logger.warning("StudioConfig", "Configuration root must be a mapping, using defaults");
        return false;
    }

    const YAML::Node scanner = root["scanner"];
    if (scanner && scanner["excluded_dirs"]) {
        const YAML::Node excluded = scanner["excluded_dirs"];
        if (excluded.IsSequence()) {
            for (const auto& name : excluded) {
                try {
                    config.excluded_dirs.push_back(name.as<std::string>());
                } catch (const YAML::Exception& e) {
                    logger.warning("StudioConfig", "Invalid scanner.excluded_dirs entry, ignoring", e.what());
                }
            }
        } else {
            logger.warning("StudioConfig", "scanner.excluded_dirs must be a list, ignoring");
        }
    }

    const YAML::Node logging = root["logging"];
    if (logging) {
        if (logging["directory"]) {
            try {
                config.log_dir = logging["directory"].as<std::string>();
            } catch (const YAML::Exception& e) {
                logger.warning("StudioConfig", "Invalid logging.directory value, using default", e.what());
            }
        }
        if (logging["console_level"]) {
            try {
                config.console_level = Logger::parseLevel(logging["console_level"].as<std::string>());
            } catch (const std::exception& e) {
                logger.warning("StudioConfig", "Invalid logging.console_level value, using default", e.what());
            }
        }
        if (logging["file_enabled"]) {
            try {
                config.file_logging = logging["file_enabled"].as<bool>();
            } catch (const YAML::Exception& e) {
                logger.warning("StudioConfig", "Invalid logging.file_enabled value, using default", e.what());
            }
        }
    }

    const YAML::Node status = root["status"];
    if (status && status["token_warning_threshold"]) {
        try {
            config.token_warning_threshold = status["token_warning_threshold"].as<size_t>();
        } catch (const YAML::Exception& e) {
            logger.warning("StudioConfig", "Invalid status.token_warning_threshold value, using default", e.what());
        }
    }

    return true;
}

} // namespace

bool StudioConfig::loadFromFile(const std::string& config_path, Logger& logger) {
    try {
        YAML::Node root = YAML::LoadFile(config_path);
        bool loaded = applyYaml(*this, root, logger);
        if (loaded) {
            logger.info("StudioConfig", "Loaded configuration", config_path);
        }
        return loaded;
    } catch (const YAML::BadFile&) {
        logger.warning("StudioConfig", "Cannot open configuration file", config_path);
    } catch (const YAML::Exception& e) {
        logger.error("StudioConfig", "Failed to parse configuration file: " + std::string(e.what()), config_path);
    }
    return false;
}

bool StudioConfig::loadFromString(const std::string& yaml_text, Logger& logger) {
    try {
        return applyYaml(*this, YAML::Load(yaml_text), logger);
    } catch (const YAML::Exception& e) {
        logger.error("StudioConfig", "Failed to parse configuration: " + std::string(e.what()));
    }
    return false;
}

void StudioConfig::applyCommandOverrides(const Commands& commands) {
    excluded_dirs.insert(excluded_dirs.end(), commands.exclude.begin(), commands.exclude.end());

    if (commands.verbose) {
        console_level = LogLevel::DEBUG;
    } else if (commands.quiet) {
        console_level = LogLevel::ERROR;
    }
}

std::vector<std::string> StudioConfig::getMergedExcludedDirs() const {
    std::vector<std::string> merged = defaultExcludedDirs();
    for (const auto& name : excluded_dirs) {
        if (std::find(merged.begin(), merged.end(), name) == merged.end()) {
            merged.push_back(name);
        }
    }
    return merged;
}

bool StudioConfig::validate(Logger& logger) const {
    bool valid = true;

    if (log_dir.empty()) {
        logger.error("StudioConfig", "logging.directory must not be empty");
        valid = false;
    }

    if (token_warning_threshold == 0) {
        logger.error("StudioConfig", "status.token_warning_threshold must be greater than 0");
        valid = false;
    }

    for (const auto& name : excluded_dirs) {
        if (name.empty() || name.find('/') != std::string::npos || name.find('\\') != std::string::npos) {
            logger.error("StudioConfig", "Excluded directory entries must be plain names", name);
            valid = false;
        }
    }

    return valid;
}

const char* StudioConfig::defaultConfigFilename() {
    return ".context_studio.yml";
}

} // namespace ContextStudio
