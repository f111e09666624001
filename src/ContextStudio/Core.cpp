// =================================================================
// src/ContextStudio/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "ContextStudio/Core.hpp"
#include "ContextStudio/StudioSession.hpp"
#include "ContextStudio/SysInteraction.hpp"
#include "ContextStudio/ClipboardService.hpp"
#include "ContextStudio/Logger.hpp"
#include <iostream>
#include <sstream>
#include <vector>
#include <utility>
#include <filesystem>
#include <chrono>

namespace ContextStudio {

Core::Core(const Commands& commands)
    : m_commands(commands),
      m_sys(std::make_unique<SysInteraction>())
{
}

Core::~Core() = default;

int Core::run() {
    auto start_time = std::chrono::steady_clock::now();

    if (!loadConfig()) {
        return 1;
    }

    Logger& logger = Logger::getInstance();
    logger.setConsoleLogLevel(m_config.console_level);
    logger.setFileLogging(m_config.file_logging);
    logger.initialize(m_config.log_dir);
    logger.logSessionStart("load", m_commands.root_path);

    m_session = std::make_unique<StudioSession>(m_config.getMergedExcludedDirs(), logger);
    if (m_config.file_logging) {
        // Our own log files never belong in the document
        m_session->excludePath(logger.logDirectory());
    }

    int exit_code = 0;
    auto loaded = m_session->loadProject(m_commands.root_path);
    if (!loaded.first) {
        std::cerr << "Load Failed: " << loaded.second << std::endl;
        exit_code = 1;
    } else {
        exit_code = applySelection();
        int output_code = emitOutputs();
        if (exit_code == 0) {
            exit_code = output_code;
        }
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    logger.logSessionEnd("load", exit_code, static_cast<long>(duration.count()));
    logger.flush();
    return exit_code;
}

bool Core::loadConfig() {
    // The real logger is configured from this file, so report through a console-only one
    Logger bootstrap;
    bootstrap.setFileLogging(false);
    bootstrap.setConsoleLogLevel(m_commands.verbose ? LogLevel::DEBUG : LogLevel::WARNING);

    if (!m_commands.config_path.empty()) {
        if (!m_config.loadFromFile(m_commands.config_path, bootstrap)) {
            std::cerr << "Error: could not load configuration from " << m_commands.config_path << std::endl;
            return false;
        }
    } else {
        std::filesystem::path project_config =
            std::filesystem::path(m_commands.root_path) / StudioConfig::defaultConfigFilename();
        std::error_code ec;
        if (std::filesystem::is_regular_file(project_config, ec)) {
            m_config.loadFromFile(project_config.string(), bootstrap);
        }
    }

    m_config.applyCommandOverrides(m_commands);

    if (!m_config.validate(bootstrap)) {
        std::cerr << "Error: invalid configuration." << std::endl;
        return false;
    }
    return true;
}

int Core::applySelection() {
    int exit_code = 0;

    if (m_commands.select_all) {
        auto result = m_session->toggle(m_session->tree().root(), CheckState::Checked);
        if (!result.first) {
            std::cerr << "Application Error: " << result.second << std::endl;
            exit_code = 1;
        }
    }

    for (const auto& path : m_commands.select) {
        auto result = m_session->togglePath(path, CheckState::Checked);
        if (!result.first) {
            std::cerr << "Selection Error: " << result.second << std::endl;
            exit_code = 1;
        }
    }

    return exit_code;
}

int Core::emitOutputs() {
    const Preview& preview = m_session->preview();
    int exit_code = 0;

    if (m_commands.show_tree) {
        std::cout << renderTree(m_session->tree());
    }

    if (!m_commands.output_path.empty()) {
        if (!m_sys->writeFile(m_commands.output_path, preview.document)) {
            CS_LOG_ERROR("Core", "Failed to write context to " + m_commands.output_path);
            std::cerr << "Error: failed to write " << m_commands.output_path << std::endl;
            exit_code = 1;
        } else {
            CS_LOG_INFO("Core", "Context written to " + m_commands.output_path);
        }
    } else if (!m_commands.show_tree) {
        std::cout << preview.document;
        std::cout.flush();
    }

    std::cerr << formatStatus(preview.selected_files, preview.estimated_tokens,
                              m_config.token_warning_threshold) << std::endl;

    if (m_commands.copy) {
        ClipboardService clipboard(std::make_unique<CommandClipboardBackend>());
        auto copied = m_session->copyToClipboard(clipboard);
        if (copied.first) {
            std::cerr << copied.second << std::endl;
        } else {
            std::cerr << "Copy Failed: " << copied.second << std::endl;
            exit_code = 1;
        }
    }

    return exit_code;
}

std::string Core::renderTree(const SelectionTree& tree) {
    std::ostringstream out;
    if (tree.empty()) {
        return "";
    }

    // Explicit stack of (node, depth), first child on top
    std::vector<std::pair<NodeId, size_t>> stack = {{tree.root(), 0}};
    while (!stack.empty()) {
        NodeId id = stack.back().first;
        size_t depth = stack.back().second;
        stack.pop_back();

        const auto& node = tree.node(id);
        const char* marker = "[ ]";
        if (node.check_state == CheckState::Checked) {
            marker = "[x]";
        } else if (node.check_state == CheckState::Partial) {
            marker = "[~]";
        }

        out << std::string(depth * 2, ' ') << marker << ' ' << node.name;
        if (node.kind == NodeKind::Directory) {
            out << '/';
        }
        out << '\n';

        for (auto it = node.children.rbegin(); it != node.children.rend(); ++it) {
            stack.emplace_back(*it, depth + 1);
        }
    }
    return out.str();
}

std::string Core::formatStatus(size_t file_count, size_t token_count, size_t warning_threshold) {
    std::ostringstream status;
    status << "Files: " << file_count << " | Est. Tokens: " << token_count;
    if (token_count > warning_threshold) {
        status << " (exceeds " << warning_threshold << ")";
    }
    return status.str();
}

} // namespace ContextStudio
