// =================================================================
// include/ContextStudio/StudioSession.hpp
// =================================================================
// Defines the session that ties scanning, selection and assembly together.

#pragma once

#include "ContextStudio/SelectionTree.hpp"
#include "ContextStudio/ContextBuilder.hpp"
#include <string>
#include <vector>
#include <utility>
#include <filesystem>

namespace ContextStudio {

class Logger;
class ClipboardService;

/**
 * @brief Output handed to the presentation layer after every change
 */
struct Preview {
    std::string document;
    size_t estimated_tokens = 0;
    size_t selected_files = 0;
};

/**
 * @brief Single owner of the active project
 *
 * Loading scans the root and replaces the selection tree only when the
 * scan succeeded. Every settled toggle regenerates the preview. Errors are
 * caught here and returned as (false, message); the previous tree and
 * preview stay in place.
 */
class StudioSession {
public:
    StudioSession(std::vector<std::string> excluded_dirs, Logger& logger);
    explicit StudioSession(std::vector<std::string> excluded_dirs);

    StudioSession(const StudioSession&) = delete;
    StudioSession& operator=(const StudioSession&) = delete;

    /**
     * @brief Scan a root directory and make it the active project
     * @return (true, "") on success, (false, message) otherwise
     */
    std::pair<bool, std::string> loadProject(const std::string& root_path);

    /**
     * @brief Keep a directory out of every later scan, such as the log directory
     */
    void excludePath(const std::filesystem::path& path) { m_excluded_paths.push_back(path); }

    /**
     * @brief Toggle a node of the active tree
     */
    std::pair<bool, std::string> toggle(NodeId id, CheckState state);

    /**
     * @brief Toggle a node given by absolute path or path relative to the root
     */
    std::pair<bool, std::string> togglePath(const std::string& path, CheckState state);

    /**
     * @brief Copy the current document through a clipboard service
     */
    std::pair<bool, std::string> copyToClipboard(ClipboardService& clipboard) const;

    bool isLoaded() const { return m_loaded; }
    const SelectionTree& tree() const { return m_tree; }
    const std::filesystem::path& rootPath() const { return m_root_path; }
    const Preview& preview() const { return m_preview; }

private:
    std::vector<std::string> m_excluded_dirs;
    std::vector<std::filesystem::path> m_excluded_paths;
    Logger& m_logger;
    ContextBuilder m_builder;

    bool m_loaded = false;
    std::filesystem::path m_root_path;
    SelectionTree m_tree;
    Preview m_preview;

    void regeneratePreview();
};

} // namespace ContextStudio
