#include "features/navigation_feature.hpp"

#include "core/scope.hpp"

namespace features {
std::optional<ScopeRef> handle_scope_selected(
    bool selecting_programmatically,
    Gtk::TreeView& tree_view,
    const Gtk::TreeModelColumn<Glib::ustring>& node_id_column,
    const core::ScopeTree& scope_tree) {
    if (selecting_programmatically) {
        return std::nullopt;
    }

    auto iter = tree_view.get_selection()->get_selected();
    if (!iter) {
        return std::nullopt;
    }

    Glib::ustring nodeId = (*iter)[node_id_column];
    const core::ScopeTreeNode* node = scope_tree.find(nodeId.raw());
    if (!node) {
        return std::nullopt;
    }
    return node->scope;
}

void reveal_scope(
    bool& selecting_programmatically,
    const ScopeRef& scope,
    const std::map<std::string, Gtk::TreeModel::iterator>& node_iters,
    Gtk::TreeView& tree_view,
    const Glib::RefPtr<Gtk::TreeStore>& tree_store) {
    auto target = node_iters.find(core::node_id_for_scope(scope));
    if (target == node_iters.end()) {
        return;
    }

    const auto ids = core::expanded_node_ids(scope);
    for (const auto& id : ids) {
        auto it = node_iters.find(id);
        if (it != node_iters.end() && it != target) {
            tree_view.expand_row(tree_store->get_path(it->second), false);
        }
    }

    selecting_programmatically = true;
    auto path = tree_store->get_path(target->second);
    tree_view.expand_to_path(path);
    tree_view.get_selection()->select(target->second);
    tree_view.scroll_to_row(path);
    selecting_programmatically = false;
}
}  // namespace features
