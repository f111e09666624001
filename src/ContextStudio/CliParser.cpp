// =================================================================
// src/ContextStudio/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "ContextStudio/CliParser.hpp"

namespace ContextStudio {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>(
        "Context Studio: select project files and assemble them into one LLM prompt context.");

    m_app->add_option("path", m_commands.root_path, "Project root directory (default: current directory)");

    setupSelectionOptions(*m_app);
    setupOutputOptions(*m_app);
    setupSettingsOptions(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupSelectionOptions(CLI::App& app) {
    app.add_option("-s,--select", m_commands.select,
                   "Files or directories to check, relative to the project root.");
    app.add_flag("-a,--select-all", m_commands.select_all, "Check the whole project tree.");
    app.add_option("-x,--exclude", m_commands.exclude,
                   "Additional directory names to skip while scanning.");
}

void CliParser::setupOutputOptions(CLI::App& app) {
    app.add_flag("-t,--tree", m_commands.show_tree, "Print the project tree with selection markers.");
    app.add_option("-o,--output", m_commands.output_path, "Write the context document to this file instead of stdout.");
    app.add_flag("-c,--copy", m_commands.copy, "Copy the context document to the system clipboard.");
}

void CliParser::setupSettingsOptions(CLI::App& app) {
    app.add_option("--config", m_commands.config_path, "Path to a YAML configuration file.")
        ->check(CLI::ExistingFile);
    auto* verbose = app.add_flag("-v,--verbose", m_commands.verbose, "Show debug diagnostics.");
    auto* quiet = app.add_flag("-q,--quiet", m_commands.quiet, "Only show errors.");
    verbose->excludes(quiet);
}

} // namespace ContextStudio
