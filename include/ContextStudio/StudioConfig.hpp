// =================================================================
// include/ContextStudio/StudioConfig.hpp
// =================================================================
// Configuration structure loaded from an optional YAML file.

#pragma once

#include "ContextStudio/Logger.hpp"
#include <string>
#include <vector>

namespace ContextStudio {

struct Commands;

/**
 * @brief Settings for a Context Studio run
 *
 * Example file:
 *
 *   scanner:
 *     excluded_dirs: [build, dist]
 *   logging:
 *     directory: .context_studio/logs
 *     console_level: info
 *     file_enabled: true
 *   status:
 *     token_warning_threshold: 32000
 */
struct StudioConfig {
    // Scanner settings, added to the default excluded set
    std::vector<std::string> excluded_dirs;

    // Logging settings
    std::string log_dir = ".context_studio/logs";
    LogLevel console_level = LogLevel::INFO;
    bool file_logging = true;

    // Status settings
    size_t token_warning_threshold = 32000;

    /**
     * @brief Load settings from a YAML file
     * @param config_path Path to the YAML file
     * @param logger Logger receiving parse problems
     * @return True if the file was read and parsed; values that fail to
     *         parse keep their defaults
     */
    bool loadFromFile(const std::string& config_path, Logger& logger);

    /**
     * @brief Load settings from YAML text
     */
    bool loadFromString(const std::string& yaml_text, Logger& logger);

    /**
     * @brief Apply command-line overrides
     * @param commands Command-line arguments
     */
    void applyCommandOverrides(const Commands& commands);

    /**
     * @brief Default excluded names followed by configured ones, without duplicates
     */
    std::vector<std::string> getMergedExcludedDirs() const;

    /**
     * @brief Validate configuration settings
     * @param logger Logger receiving the problems found
     * @return True if configuration is valid
     */
    bool validate(Logger& logger) const;

    /**
     * @brief Name of the per-project config file looked up in the root
     */
    static const char* defaultConfigFilename();
};

} // namespace ContextStudio
