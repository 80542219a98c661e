#include "core/scope_tree.hpp"
#include "test_devices.hpp"

#include <cassert>
#include <string>
#include <vector>

using namespace test_devices;

int main() {
    {
        core::ScopeTree tree = core::build_scope_tree({});
        assert(tree.empty());
        assert(tree.roots().empty());
    }

    {
        // Single-output device: one merged node carrying the output's identity.
        Device strip = single_strip();
        strip.outputs[0].mode.selected_effect_id = "rainbow";
        strip.outputs[0].mode.effective_effect_id = "rainbow";
        core::ScopeTree tree = core::build_scope_tree({strip});

        assert(tree.roots().size() == 1);
        const core::ScopeTreeNode& root = tree.node(tree.roots()[0]);
        assert(root.kind == core::ScopeNodeKind::Device);
        assert(root.name == "Strip Controller");
        assert(root.id == "out:COM3:out-0");
        assert(root.scope == scope("COM3", std::string("out-0")));
        assert(root.control_state == core::ControlState::Explicit);
        assert(root.children.empty());
        assert(tree.find("dev:COM3") == nullptr);
    }

    {
        // Merged node adopts the segments of its single output directly.
        Device strip = device("COM4", "", {linear_output("o", "Strip", 12, {segment("s1", "A", 6), segment("s2", "B", 6)})});
        core::ScopeTree tree = core::build_scope_tree({strip});
        const core::ScopeTreeNode& root = tree.node(tree.roots()[0]);
        assert(root.name == "COM4");
        assert(root.children.size() == 2);
        assert(tree.node(root.children[0]).id == "seg:COM4:o:s1");
        assert(tree.node(root.children[1]).kind == core::ScopeNodeKind::Segment);
    }

    {
        core::ScopeTree tree = core::build_scope_tree({two_outputs(), segmented_pair()});
        assert(tree.roots().size() == 2);

        const core::ScopeTreeNode& hub = tree.node(tree.roots()[0]);
        assert(hub.id == "dev:COM5");
        assert(hub.subtitle == "COM5");
        assert(hub.children.size() == 2);

        const core::ScopeTreeNode& shelf = tree.node(hub.children[0]);
        assert(shelf.id == "out:COM5:a");
        assert(shelf.kind == core::ScopeNodeKind::Output);
        assert(shelf.children.size() == 1);

        // Matrix outputs never expose segment children.
        const core::ScopeTreeNode& panel = tree.node(hub.children[1]);
        assert(panel.id == "out:COM5:b");
        assert(panel.children.empty());

        const core::ScopeTreeNode* rear = tree.find("out:COM7:rear");
        assert(rear != nullptr);
        assert(rear->children.empty());

        const core::ScopeTreeNode* bottom = tree.find("seg:COM7:front:f2");
        assert(bottom != nullptr);
        assert(bottom->scope == scope("COM7", std::string("front"), std::string("f2")));
    }

    {
        // Ids depend on the ids of the snapshot only.
        core::ScopeTree first = core::build_scope_tree({two_outputs(), segmented_pair()});
        core::ScopeTree second = core::build_scope_tree({two_outputs(), segmented_pair()});
        assert(first.nodes().size() == second.nodes().size());
        for (std::size_t i = 0; i < first.nodes().size(); ++i) {
            assert(first.nodes()[i].id == second.nodes()[i].id);
        }
    }

    return 0;
}
