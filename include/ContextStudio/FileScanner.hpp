// =================================================================
// include/ContextStudio/FileScanner.hpp
// =================================================================
// Header for directory tree discovery with cycle protection.

#pragma once

#include <string>
#include <vector>
#include <set>
#include <utility>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <unordered_set>

namespace ContextStudio {

class Logger;

/**
 * @brief Kind of a filesystem entry in a scanned tree
 */
enum class NodeKind {
    Directory,
    File
};

/**
 * @brief One entry of a scan result
 *
 * Children are held by value and are not sorted.
 */
struct ScanNode {
    std::string name;
    std::filesystem::path absolute_path;
    NodeKind kind = NodeKind::File;
    std::vector<ScanNode> children;

    ScanNode() = default;
    ScanNode(const std::string& node_name, const std::filesystem::path& path, NodeKind node_kind)
        : name(node_name), absolute_path(path), kind(node_kind) {}
};

/**
 * @brief Thrown when the scan root is missing or not a directory
 */
class InvalidRootError : public std::runtime_error {
public:
    explicit InvalidRootError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Directory names skipped by default
 */
const std::vector<std::string>& defaultExcludedDirs();

/**
 * @brief Scans a directory tree into a ScanNode hierarchy
 *
 * Entries are classified by their resolved type. Directories on the current
 * root-to-node path are tracked by (device, inode) so that a symlink back to
 * an ancestor scans as an empty directory instead of recursing forever.
 * Errors on single entries or directories are logged and skipped; scan()
 * itself never throws.
 */
class FileScanner {
public:
    /**
     * @brief Construct a new FileScanner
     * @param root_path The root directory to scan from
     * @param excluded_dirs Directory names to skip entirely
     * @param logger Logger receiving diagnostics
     * @throws InvalidRootError if root_path does not exist or is not a directory
     */
    FileScanner(const std::string& root_path,
                const std::vector<std::string>& excluded_dirs,
                Logger& logger);

    FileScanner(const std::string& root_path, const std::vector<std::string>& excluded_dirs);

    /**
     * @brief Skip one specific directory wherever it is reached
     *
     * The directory is matched by (device, inode), so relative paths and
     * links to it are caught too. Paths that do not exist are ignored.
     * @param path Directory to leave out of the scan
     */
    void excludePath(const std::filesystem::path& path);

    /**
     * @brief Scan the root directory
     * @return Root node (kind Directory) with the discovered children; an
     *         empty root node if the scan failed unexpectedly
     */
    ScanNode scan();

    /**
     * @brief Canonical root path
     */
    const std::filesystem::path& rootPath() const { return m_root_path; }

    // Counters from the last scan
    size_t directoryCount() const { return m_directory_count; }
    size_t fileCount() const { return m_file_count; }
    size_t skippedCount() const { return m_skipped_count; }
    size_t cycleCount() const { return m_cycle_count; }

private:
    using FileIdentity = std::pair<std::uintmax_t, std::uintmax_t>;

    std::filesystem::path m_root_path;
    std::unordered_set<std::string> m_excluded_dirs;
    std::set<FileIdentity> m_excluded_paths;
    Logger& m_logger;

    std::set<FileIdentity> m_ancestors;
    size_t m_directory_count = 0;
    size_t m_file_count = 0;
    size_t m_skipped_count = 0;
    size_t m_cycle_count = 0;

    /**
     * @brief Scan one directory, filling node.children
     */
    void scanDirectory(ScanNode& node);

    /**
     * @brief Device and inode of a path, following symlinks
     * @return false if the path could not be stat'ed
     */
    bool identityOf(const std::filesystem::path& path, FileIdentity& identity) const;

    void resetCounters();
};

} // namespace ContextStudio
