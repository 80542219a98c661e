#include "core/scope_tree.hpp"

#include <utility>

namespace {
core::ScopeTreeNode make_segment_node(const Device& device, const OutputPort& output, const Segment& segment) {
    core::ScopeTreeNode node;
    node.kind = core::ScopeNodeKind::Segment;
    node.name = segment.name;
    node.scope.port = device.port;
    node.scope.output_id = output.id;
    node.scope.segment_id = segment.id;
    node.id = core::node_id_for_scope(node.scope);
    node.control_state = core::control_state_from_mode(segment.mode);
    return node;
}

bool has_segment_children(const OutputPort& output) {
    return output.output_type == SegmentType::Linear && !output.segments.empty();
}

void append_segments(core::ScopeTree& tree, std::size_t parent, const Device& device, const OutputPort& output) {
    if (!has_segment_children(output)) {
        return;
    }
    for (const auto& segment : output.segments) {
        tree.add_child(parent, make_segment_node(device, output, segment));
    }
}
}  // namespace

namespace core {
const ScopeTreeNode* ScopeTree::find(const std::string& id) const {
    auto it = m_index.find(id);
    if (it == m_index.end()) {
        return nullptr;
    }
    return &m_nodes[it->second];
}

std::size_t ScopeTree::insert(ScopeTreeNode node) {
    const std::size_t index = m_nodes.size();
    m_index[node.id] = index;
    m_nodes.push_back(std::move(node));
    return index;
}

std::size_t ScopeTree::add_root(ScopeTreeNode node) {
    const std::size_t index = insert(std::move(node));
    m_roots.push_back(index);
    return index;
}

std::size_t ScopeTree::add_child(std::size_t parent, ScopeTreeNode node) {
    const std::size_t index = insert(std::move(node));
    m_nodes[parent].children.push_back(index);
    return index;
}

ScopeTree build_scope_tree(const std::vector<Device>& devices) {
    ScopeTree tree;

    for (const auto& device : devices) {
        ScopeTreeNode root;
        root.kind = ScopeNodeKind::Device;
        root.name = device.model.empty() ? device.port : device.model;
        root.subtitle = device.port;
        root.scope.port = device.port;

        if (device.outputs.size() == 1) {
            // Merged node: device presentation, output identity.
            const OutputPort& output = device.outputs.front();
            root.scope.output_id = output.id;
            root.id = node_id_for_scope(root.scope);
            root.control_state = control_state_from_mode(output.mode);
            const std::size_t index = tree.add_root(std::move(root));
            append_segments(tree, index, device, output);
            continue;
        }

        root.id = node_id_for_scope(root.scope);
        root.control_state = control_state_from_mode(device.mode);
        const std::size_t device_index = tree.add_root(std::move(root));

        for (const auto& output : device.outputs) {
            ScopeTreeNode child;
            child.kind = ScopeNodeKind::Output;
            child.name = output.name;
            child.scope.port = device.port;
            child.scope.output_id = output.id;
            child.id = node_id_for_scope(child.scope);
            child.control_state = control_state_from_mode(output.mode);
            const std::size_t output_index = tree.add_child(device_index, std::move(child));
            append_segments(tree, output_index, device, output);
        }
    }

    return tree;
}
}  // namespace core
