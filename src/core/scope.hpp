#ifndef CORE_SCOPE_HPP
#define CORE_SCOPE_HPP

#include "core/models.hpp"

#include <string>
#include <vector>

namespace core {
enum class ControlState {
    None,
    Explicit,
    Inherited
};

const Device* find_device(const std::vector<Device>& devices, const std::string& port);
const OutputPort* find_output(const Device& device, const std::string& output_id);
const Segment* find_segment(const OutputPort& output, const std::string& segment_id);

// Resolves a possibly stale scope against the current snapshot. Total and
// idempotent; an unknown port is returned unchanged.
ScopeRef normalize_scope(const ScopeRef& scope, const std::vector<Device>& devices);

ControlState control_state_from_mode(const ScopeModeState& mode);
const char* control_state_name(ControlState state);

std::string node_id_for_scope(const ScopeRef& scope);
std::vector<std::string> expanded_node_ids(const ScopeRef& scope);

const ScopeModeState* mode_for_scope(const Device& device, const ScopeRef& scope);
const ScopeBrightnessState* brightness_for_scope(const Device& device, const ScopeRef& scope);
std::string scope_display_title(const Device& device, const ScopeRef& scope);

// Fills every effective_* field of the device tree: a node's own explicit
// value wins, else its parent's effective value.
void resolve_scope_inheritance(Device& device);
}  // namespace core

#endif
