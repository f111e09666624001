// =================================================================
// include/ContextStudio/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>
#include <vector>

namespace ContextStudio {

// A simple struct to hold parsed command information.
struct Commands {
    std::string root_path = ".";

    // Selection
    std::vector<std::string> select;
    bool select_all = false;
    std::vector<std::string> exclude;

    // Output
    bool show_tree = false;
    std::string output_path;
    bool copy = false;

    // Settings
    std::string config_path;
    bool verbose = false;
    bool quiet = false;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI options and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupSelectionOptions(CLI::App& app);
    void setupOutputOptions(CLI::App& app);
    void setupSettingsOptions(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace ContextStudio
