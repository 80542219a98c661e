#ifndef FEATURES_NAVIGATION_FEATURE_HPP
#define FEATURES_NAVIGATION_FEATURE_HPP

#include "core/models.hpp"
#include "core/scope_tree.hpp"

#include <gtkmm.h>

#include <map>
#include <optional>
#include <string>

namespace features {
// Scope of the row the user picked; empty for programmatic selections.
std::optional<ScopeRef> handle_scope_selected(
    bool selecting_programmatically,
    Gtk::TreeView& tree_view,
    const Gtk::TreeModelColumn<Glib::ustring>& node_id_column,
    const core::ScopeTree& scope_tree);

// Expands the ancestors of the scope's row, then selects and scrolls to it.
void reveal_scope(
    bool& selecting_programmatically,
    const ScopeRef& scope,
    const std::map<std::string, Gtk::TreeModel::iterator>& node_iters,
    Gtk::TreeView& tree_view,
    const Glib::RefPtr<Gtk::TreeStore>& tree_store);
}

#endif
