#include "lighting_window.hpp"

#include "core/logging.hpp"
#include "core/scope.hpp"

namespace {
Glib::ustring state_text(core::ControlState state) {
    return state == core::ControlState::None ? "" : core::control_state_name(state);
}
}  // namespace

void LightingWindow::load_devices(bool rescan) {
    if (m_DevicesController.effects().empty() && !m_DevicesController.load_effects()) {
        logging::warn("ui.effects_unavailable");
    }

    const bool ok = rescan ? m_DevicesController.rescan() : m_DevicesController.refresh();
    if (ok) {
        rebuild_scope_tree();
    }
    update_scope_views();
    show_controller_status();
}

void LightingWindow::rebuild_scope_tree() {
    m_selecting_programmatically = true;
    m_TreeView.get_selection()->unselect_all();
    m_ScopeTreeStore->clear();
    m_NodeIters.clear();

    m_ScopeTree = core::build_scope_tree(m_DevicesController.devices());
    for (std::size_t root : m_ScopeTree.roots()) {
        append_scope_node(root, nullptr);
    }
    m_selecting_programmatically = false;
}

void LightingWindow::append_scope_node(std::size_t index, const Gtk::TreeModel::iterator* parent) {
    const core::ScopeTreeNode& node = m_ScopeTree.node(index);

    auto iter = parent ? m_ScopeTreeStore->append((*parent)->children()) : m_ScopeTreeStore->append();
    Glib::ustring name = node.name;
    if (!node.subtitle.empty()) {
        name += " (" + node.subtitle + ")";
    }
    (*iter)[m_ScopeColumns.m_col_name] = name;
    (*iter)[m_ScopeColumns.m_col_state] = state_text(node.control_state);
    (*iter)[m_ScopeColumns.m_col_node_id] = node.id;
    m_NodeIters[node.id] = iter;

    for (std::size_t child : node.children) {
        append_scope_node(child, &iter);
    }
}

// Effect changes only move control states; the row set stays the same.
void LightingWindow::refresh_scope_states() {
    m_ScopeTree = core::build_scope_tree(m_DevicesController.devices());
    for (const auto& node : m_ScopeTree.nodes()) {
        auto it = m_NodeIters.find(node.id);
        if (it == m_NodeIters.end()) {
            continue;
        }
        (*it->second)[m_ScopeColumns.m_col_state] = state_text(node.control_state);
    }
}
