// =================================================================
// src/ContextStudio/SelectionTree.cpp
// =================================================================
// Implementation for the tri-state selection model.

#include "ContextStudio/SelectionTree.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

namespace ContextStudio {

namespace {

// ASCII-only folding, independent of the process locale; other bytes compare as-is
std::string toLower(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    });
    return lower;
}

// Directories first, then case-insensitive name; exact name breaks ties.
bool presentationOrder(const ScanNode* a, const ScanNode* b) {
    if (a->kind != b->kind) {
        return a->kind == NodeKind::Directory;
    }
    std::string lower_a = toLower(a->name);
    std::string lower_b = toLower(b->name);
    if (lower_a != lower_b) {
        return lower_a < lower_b;
    }
    return a->name < b->name;
}

std::string indexKey(const fs::path& path) {
    fs::path normal = path.lexically_normal();
    if (normal.has_parent_path() && normal.filename().empty()) {
        normal = normal.parent_path();
    }
    return normal.generic_string();
}

} // namespace

std::string checkStateName(CheckState state) {
    switch (state) {
        case CheckState::Unchecked: return "unchecked";
        case CheckState::Checked: return "checked";
        case CheckState::Partial: return "partial";
        default: return "unknown";
    }
}

SelectionTree SelectionTree::build(const ScanNode& scan_result) {
    SelectionTree tree;

    Node root;
    root.name = scan_result.name;
    root.absolute_path = scan_result.absolute_path;
    root.kind = scan_result.kind;
    tree.m_nodes.push_back(std::move(root));
    tree.m_path_index[indexKey(scan_result.absolute_path)] = 0;

    // Explicit stack so arbitrarily deep trees do not exhaust the call stack
    std::vector<std::pair<const ScanNode*, NodeId>> pending;
    pending.emplace_back(&scan_result, 0);

    while (!pending.empty()) {
        const ScanNode* scan_node = pending.back().first;
        NodeId parent_id = pending.back().second;
        pending.pop_back();

        std::vector<const ScanNode*> sorted;
        sorted.reserve(scan_node->children.size());
        for (const auto& child : scan_node->children) {
            sorted.push_back(&child);
        }
        std::sort(sorted.begin(), sorted.end(), presentationOrder);

        for (const ScanNode* child : sorted) {
            NodeId child_id = tree.m_nodes.size();

            Node node;
            node.name = child->name;
            node.absolute_path = child->absolute_path;
            node.kind = child->kind;
            node.parent = parent_id;
            tree.m_nodes.push_back(std::move(node));
            tree.m_nodes[parent_id].children.push_back(child_id);
            tree.m_path_index[indexKey(child->absolute_path)] = child_id;

            if (!child->children.empty()) {
                pending.emplace_back(child, child_id);
            }
        }
    }

    return tree;
}

void SelectionTree::toggle(NodeId id, CheckState requested) {
    if (id >= m_nodes.size()) {
        throw std::out_of_range("Unknown node id: " + std::to_string(id));
    }
    if (requested == CheckState::Partial) {
        throw std::invalid_argument("A node can only be toggled to checked or unchecked");
    }

    m_nodes[id].check_state = requested;
    pushDown(id, requested);
    pullUp(id);

    notifyListeners();
}

std::vector<fs::path> SelectionTree::checkedFiles() const {
    std::vector<fs::path> checked;
    if (m_nodes.empty()) {
        return checked;
    }

    std::vector<NodeId> stack = {0};
    while (!stack.empty()) {
        const Node& current = m_nodes[stack.back()];
        stack.pop_back();

        if (current.check_state == CheckState::Unchecked) {
            continue;
        }
        if (current.kind == NodeKind::File) {
            if (current.check_state == CheckState::Checked) {
                checked.push_back(current.absolute_path);
            }
            continue;
        }
        // Reverse push keeps the first child on top of the stack
        for (auto it = current.children.rbegin(); it != current.children.rend(); ++it) {
            stack.push_back(*it);
        }
    }

    return checked;
}

size_t SelectionTree::checkedFileCount() const {
    size_t count = 0;
    for (const auto& n : m_nodes) {
        if (n.kind == NodeKind::File && n.check_state == CheckState::Checked) {
            ++count;
        }
    }
    return count;
}

SelectionTree::ListenerId SelectionTree::addChangeListener(ChangeListener listener) {
    ListenerId id = m_next_listener_id++;
    m_listeners[id] = std::move(listener);
    return id;
}

void SelectionTree::removeChangeListener(ListenerId id) {
    m_listeners.erase(id);
}

const SelectionTree::Node& SelectionTree::node(NodeId id) const {
    if (id >= m_nodes.size()) {
        throw std::out_of_range("Unknown node id: " + std::to_string(id));
    }
    return m_nodes[id];
}

NodeId SelectionTree::findByPath(const fs::path& path) const {
    if (m_nodes.empty()) {
        return kInvalidNode;
    }

    fs::path full = path.is_absolute() ? path : m_nodes[0].absolute_path / path;
    auto it = m_path_index.find(indexKey(full));
    return it == m_path_index.end() ? kInvalidNode : it->second;
}

void SelectionTree::pushDown(NodeId id, CheckState state) {
    std::vector<NodeId> stack(m_nodes[id].children.begin(), m_nodes[id].children.end());
    while (!stack.empty()) {
        NodeId current = stack.back();
        stack.pop_back();

        m_nodes[current].check_state = state;
        stack.insert(stack.end(), m_nodes[current].children.begin(), m_nodes[current].children.end());
    }
}

void SelectionTree::pullUp(NodeId id) {
    NodeId ancestor = m_nodes[id].parent;
    while (ancestor != kInvalidNode) {
        Node& current = m_nodes[ancestor];
        CheckState recomputed = computeFromChildren(current);
        if (recomputed == current.check_state) {
            break; // Nothing above can change either
        }
        current.check_state = recomputed;
        ancestor = current.parent;
    }
}

CheckState SelectionTree::computeFromChildren(const Node& node) const {
    if (node.children.empty()) {
        return node.check_state;
    }

    size_t checked = 0;
    size_t unchecked = 0;
    for (NodeId child : node.children) {
        switch (m_nodes[child].check_state) {
            case CheckState::Checked: ++checked; break;
            case CheckState::Unchecked: ++unchecked; break;
            case CheckState::Partial: break;
        }
    }

    if (checked == node.children.size()) {
        return CheckState::Checked;
    }
    if (unchecked == node.children.size()) {
        return CheckState::Unchecked;
    }
    return CheckState::Partial;
}

void SelectionTree::notifyListeners() const {
    // Copy so a listener may remove itself while being notified
    auto listeners = m_listeners;
    for (const auto& entry : listeners) {
        entry.second(*this);
    }
}

} // namespace ContextStudio
