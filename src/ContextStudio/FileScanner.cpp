// =================================================================
// src/ContextStudio/FileScanner.cpp
// =================================================================
// Implementation for directory tree discovery.

#include "ContextStudio/FileScanner.hpp"
#include "ContextStudio/Logger.hpp"
#include <system_error>
#include <functional>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace ContextStudio {

const std::vector<std::string>& defaultExcludedDirs() {
    static const std::vector<std::string> excluded = {
        ".git", "__pycache__", "venv", "node_modules", ".idea", ".vscode"
    };
    return excluded;
}

FileScanner::FileScanner(const std::string& root_path,
                         const std::vector<std::string>& excluded_dirs,
                         Logger& logger)
    : m_excluded_dirs(excluded_dirs.begin(), excluded_dirs.end()),
      m_logger(logger)
{
    std::error_code ec;
    fs::path root(root_path);

    if (root_path.empty() || !fs::exists(root, ec)) {
        m_logger.error("FileScanner", "Root path does not exist", root_path);
        throw InvalidRootError("Path does not exist: " + root_path);
    }
    if (!fs::is_directory(root, ec)) {
        m_logger.error("FileScanner", "Root path is not a directory", root_path);
        throw InvalidRootError("Path is not a directory: " + root_path);
    }

    m_root_path = fs::canonical(root, ec);
    if (ec) {
        m_logger.warning("FileScanner", "Could not resolve root path, using absolute path",
                         root_path + ": " + ec.message());
        m_root_path = fs::absolute(root).lexically_normal();
    }
}

FileScanner::FileScanner(const std::string& root_path, const std::vector<std::string>& excluded_dirs)
    : FileScanner(root_path, excluded_dirs, Logger::getInstance()) {}

void FileScanner::excludePath(const fs::path& path) {
    FileIdentity identity;
    if (identityOf(path, identity)) {
        m_excluded_paths.insert(identity);
    }
}

ScanNode FileScanner::scan() {
    resetCounters();

    std::string root_name = m_root_path.filename().string();
    if (root_name.empty()) {
        root_name = m_root_path.string();
    }

    m_logger.info("FileScanner", "Starting scan", m_root_path.string());

    try {
        ScanNode root(root_name, m_root_path, NodeKind::Directory);
        scanDirectory(root);
        m_logger.logScanSummary(m_root_path.string(), m_directory_count, m_file_count,
                                m_skipped_count, m_cycle_count);
        return root;
    } catch (const std::exception& e) {
        m_logger.critical("FileScanner", "Fatal error during directory scan", e.what());
        m_ancestors.clear();
        return ScanNode(root_name, m_root_path, NodeKind::Directory);
    }
}

void FileScanner::scanDirectory(ScanNode& node) {
    FileIdentity identity;
    bool has_identity = identityOf(node.absolute_path, identity);
    if (has_identity) {
        if (m_ancestors.count(identity) > 0) {
            m_logger.warning("FileScanner", "Symlink loop detected, skipping", node.absolute_path.string());
            ++m_cycle_count;
            return;
        }
        m_ancestors.insert(identity);
    }

    std::error_code ec;
    fs::directory_iterator it(node.absolute_path, ec);
    if (ec) {
        if (ec == std::errc::permission_denied) {
            m_logger.error("FileScanner", "Permission denied for directory", node.absolute_path.string());
        } else {
            m_logger.error("FileScanner", "OS error scanning directory",
                           node.absolute_path.string() + ": " + ec.message());
        }
        ++m_skipped_count;
    }

    const fs::directory_iterator end;
    while (!ec && it != end) {
        const fs::directory_entry& entry = *it;
        std::string name = entry.path().filename().string();

        std::error_code status_ec;
        fs::file_status status = entry.status(status_ec);

        if (status.type() == fs::file_type::not_found) {
            m_logger.debug("FileScanner", "Skipping dangling entry", entry.path().string());
            ++m_skipped_count;
        } else if (status_ec) {
            m_logger.warning("FileScanner", "Cannot access entry",
                             entry.path().string() + ": " + status_ec.message());
            ++m_skipped_count;
        } else if (fs::is_directory(status)) {
            FileIdentity child_identity;
            if (m_excluded_dirs.count(name) > 0) {
                m_logger.debug("FileScanner", "Skipping excluded directory", entry.path().string());
                ++m_skipped_count;
            } else if (!m_excluded_paths.empty() && identityOf(entry.path(), child_identity) &&
                       m_excluded_paths.count(child_identity) > 0) {
                m_logger.debug("FileScanner", "Skipping excluded path", entry.path().string());
                ++m_skipped_count;
            } else {
                ScanNode child(name, node.absolute_path / name, NodeKind::Directory);
                ++m_directory_count;
                scanDirectory(child);
                node.children.push_back(std::move(child));
            }
        } else if (fs::is_regular_file(status)) {
            ++m_file_count;
            node.children.emplace_back(name, node.absolute_path / name, NodeKind::File);
        } else {
            m_logger.debug("FileScanner", "Skipping special file", entry.path().string());
            ++m_skipped_count;
        }

        it.increment(ec);
        if (ec) {
            m_logger.error("FileScanner", "Directory listing interrupted",
                           node.absolute_path.string() + ": " + ec.message());
        }
    }

    if (has_identity) {
        m_ancestors.erase(identity);
    }
}

bool FileScanner::identityOf(const fs::path& path, FileIdentity& identity) const {
#if defined(_WIN32)
    // No inode numbers here; the resolved path stands in for the identity.
    std::error_code ec;
    fs::path resolved = fs::canonical(path, ec);
    if (ec) {
        return false;
    }
    identity = FileIdentity(0, std::hash<std::string>{}(resolved.string()));
    return true;
#else
    struct stat buffer;
    if (stat(path.c_str(), &buffer) != 0) {
        return false;
    }
    identity = FileIdentity(static_cast<std::uintmax_t>(buffer.st_dev),
                            static_cast<std::uintmax_t>(buffer.st_ino));
    return true;
#endif
}

void FileScanner::resetCounters() {
    m_ancestors.clear();
    m_directory_count = 0;
    m_file_count = 0;
    m_skipped_count = 0;
    m_cycle_count = 0;
}

} // namespace ContextStudio
