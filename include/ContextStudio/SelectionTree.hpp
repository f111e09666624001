// =================================================================
// include/ContextStudio/SelectionTree.hpp
// =================================================================
// Header for the tri-state selection model over a scanned tree.

#pragma once

#include "ContextStudio/FileScanner.hpp"
#include <string>
#include <vector>
#include <map>
#include <limits>
#include <functional>
#include <filesystem>

namespace ContextStudio {

/**
 * @brief Tri-state checkbox value
 */
enum class CheckState {
    Unchecked,
    Checked,
    Partial
};

using NodeId = std::size_t;

constexpr NodeId kInvalidNode = std::numeric_limits<NodeId>::max();

/**
 * @brief Returns "unchecked", "checked" or "partial"
 */
std::string checkStateName(CheckState state);

/**
 * @brief Selection state for every entry of a scan result
 *
 * Nodes live in a flat arena addressed by NodeId; parents are stored as ids
 * so ownership runs strictly from the arena to the nodes. Children are
 * ordered directories first, then by case-insensitive name. Case folding
 * covers ASCII letters only; names are then compared byte-wise, so
 * non-ASCII names sort by their UTF-8 bytes.
 *
 * toggle() is the only writer of check states. It pushes the requested
 * state down the whole subtree, recomputes ancestors from their direct
 * children, and notifies listeners once the tree has settled.
 */
class SelectionTree {
public:
    struct Node {
        std::string name;
        std::filesystem::path absolute_path;
        NodeKind kind = NodeKind::File;
        CheckState check_state = CheckState::Unchecked;
        NodeId parent = kInvalidNode;
        std::vector<NodeId> children;
    };

    using ChangeListener = std::function<void(const SelectionTree&)>;
    using ListenerId = std::size_t;

    SelectionTree() = default;

    /**
     * @brief Build a tree from a scan result, every node Unchecked
     * @param scan_result Root node returned by FileScanner::scan()
     */
    static SelectionTree build(const ScanNode& scan_result);

    /**
     * @brief Set a node and its whole subtree to a state and settle ancestors
     * @param id Node to toggle
     * @param requested CheckState::Checked or CheckState::Unchecked
     * @throws std::out_of_range for an unknown id
     * @throws std::invalid_argument if requested is Partial
     */
    void toggle(NodeId id, CheckState requested);

    /**
     * @brief Absolute paths of Checked file nodes, directories-first pre-order
     */
    std::vector<std::filesystem::path> checkedFiles() const;

    size_t checkedFileCount() const;

    /**
     * @brief Register a callback run after every settled toggle
     */
    ListenerId addChangeListener(ChangeListener listener);
    void removeChangeListener(ListenerId id);

    bool empty() const { return m_nodes.empty(); }
    size_t size() const { return m_nodes.size(); }

    /**
     * @brief Id of the root node, kInvalidNode for an empty tree
     */
    NodeId root() const { return m_nodes.empty() ? kInvalidNode : 0; }

    /**
     * @throws std::out_of_range for an unknown id
     */
    const Node& node(NodeId id) const;

    CheckState checkState(NodeId id) const { return node(id).check_state; }

    /**
     * @brief Find a node by absolute path or by path relative to the root
     * @return kInvalidNode if no node has that path
     */
    NodeId findByPath(const std::filesystem::path& path) const;

private:
    std::vector<Node> m_nodes;
    std::map<std::string, NodeId> m_path_index;
    std::map<ListenerId, ChangeListener> m_listeners;
    ListenerId m_next_listener_id = 0;

    void pushDown(NodeId id, CheckState state);
    void pullUp(NodeId id);
    CheckState computeFromChildren(const Node& node) const;
    void notifyListeners() const;
};

} // namespace ContextStudio
