#ifndef CORE_SCOPE_TREE_HPP
#define CORE_SCOPE_TREE_HPP

#include "core/models.hpp"
#include "core/scope.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace core {
enum class ScopeNodeKind {
    Device,
    Output,
    Segment
};

struct ScopeTreeNode {
    ScopeNodeKind kind = ScopeNodeKind::Device;
    std::string id;
    std::string name;
    // Secondary line for device rows (the port).
    std::string subtitle;
    ScopeRef scope;
    ControlState control_state = ControlState::None;
    std::vector<std::size_t> children;
};

// Device -> output -> segment tree kept in a flat arena. Node ids are derived
// from the scope so they survive rebuilds of an unchanged snapshot.
class ScopeTree {
public:
    const std::vector<ScopeTreeNode>& nodes() const { return m_nodes; }
    const std::vector<std::size_t>& roots() const { return m_roots; }
    const ScopeTreeNode& node(std::size_t index) const { return m_nodes.at(index); }
    const ScopeTreeNode* find(const std::string& id) const;
    bool empty() const { return m_nodes.empty(); }

    std::size_t add_root(ScopeTreeNode node);
    std::size_t add_child(std::size_t parent, ScopeTreeNode node);

private:
    std::size_t insert(ScopeTreeNode node);

    std::vector<ScopeTreeNode> m_nodes;
    std::vector<std::size_t> m_roots;
    std::unordered_map<std::string, std::size_t> m_index;
};

ScopeTree build_scope_tree(const std::vector<Device>& devices);
}  // namespace core

#endif
