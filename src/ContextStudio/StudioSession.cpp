// =================================================================
// src/ContextStudio/StudioSession.cpp
// =================================================================
// Implementation for the project session.

#include "ContextStudio/StudioSession.hpp"
#include "ContextStudio/FileScanner.hpp"
#include "ContextStudio/ClipboardService.hpp"
#include "ContextStudio/Logger.hpp"

namespace ContextStudio {

StudioSession::StudioSession(std::vector<std::string> excluded_dirs, Logger& logger)
    : m_excluded_dirs(std::move(excluded_dirs)), m_logger(logger), m_builder(logger) {}

StudioSession::StudioSession(std::vector<std::string> excluded_dirs)
    : StudioSession(std::move(excluded_dirs), Logger::getInstance()) {}

std::pair<bool, std::string> StudioSession::loadProject(const std::string& root_path) {
    m_logger.info("Session", "Loading project", root_path);

    try {
        FileScanner scanner(root_path, m_excluded_dirs, m_logger);
        for (const auto& path : m_excluded_paths) {
            scanner.excludePath(path);
        }
        SelectionTree tree = SelectionTree::build(scanner.scan());

        // Commit only once the new tree is complete
        m_tree = std::move(tree);
        m_root_path = scanner.rootPath();
        m_preview = Preview();
        m_loaded = true;
        m_tree.addChangeListener([this](const SelectionTree&) { regeneratePreview(); });

        m_logger.info("Session", "Project loaded", m_root_path.string() + ", " +
                      std::to_string(m_tree.size()) + " nodes");
        return {true, ""};
    } catch (const InvalidRootError& e) {
        m_logger.error("Session", "Failed to load project", e.what());
        return {false, std::string("Could not load project: ") + e.what()};
    } catch (const std::exception& e) {
        m_logger.error("Session", "Failed to load project", e.what());
        return {false, std::string("An unexpected error occurred: ") + e.what()};
    }
}

std::pair<bool, std::string> StudioSession::toggle(NodeId id, CheckState state) {
    if (!m_loaded) {
        return {false, "No project loaded."};
    }

    try {
        m_tree.toggle(id, state);
        m_logger.debug("Session", "Toggled " + m_tree.node(id).name, checkStateName(state));
        return {true, ""};
    } catch (const std::exception& e) {
        m_logger.error("Session", "Error during tree state update", e.what());
        return {false, std::string("An unexpected error occurred: ") + e.what()};
    }
}

std::pair<bool, std::string> StudioSession::togglePath(const std::string& path, CheckState state) {
    if (!m_loaded) {
        return {false, "No project loaded."};
    }

    NodeId id = m_tree.findByPath(path);
    if (id == kInvalidNode) {
        m_logger.warning("Session", "No such entry in project tree", path);
        return {false, "Not found in project: " + path};
    }
    return toggle(id, state);
}

std::pair<bool, std::string> StudioSession::copyToClipboard(ClipboardService& clipboard) const {
    return clipboard.copyText(m_preview.document);
}

void StudioSession::regeneratePreview() {
    std::vector<std::filesystem::path> selected = m_tree.checkedFiles();
    ContextResult result = m_builder.build(m_root_path, selected);

    Preview preview;
    preview.document = std::move(result.document);
    preview.estimated_tokens = result.estimated_tokens;
    preview.selected_files = selected.size();
    m_preview = std::move(preview);
}

} // namespace ContextStudio
