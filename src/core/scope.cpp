#include "core/scope.hpp"

#include <algorithm>

namespace {
ScopeRef device_scope(const std::string& port) {
    ScopeRef scope;
    scope.port = port;
    return scope;
}

ScopeRef output_scope(const std::string& port, const std::string& output_id) {
    ScopeRef scope;
    scope.port = port;
    scope.output_id = output_id;
    return scope;
}

ScopeRef segment_scope(const std::string& port, const std::string& output_id, const std::string& segment_id) {
    ScopeRef scope;
    scope.port = port;
    scope.output_id = output_id;
    scope.segment_id = segment_id;
    return scope;
}

void resolve_mode(ScopeModeState& mode, const ScopeRef& self, const ScopeModeState* parent) {
    if (mode.selected_effect_id.has_value()) {
        const bool params_from_self = mode.effective_from.has_value() && *mode.effective_from == self;
        if (!params_from_self || mode.effective_effect_id != mode.selected_effect_id) {
            mode.effective_params.reset();
        }
        mode.effective_effect_id = mode.selected_effect_id;
        mode.effective_from = self;
        return;
    }

    if (parent) {
        mode.effective_effect_id = parent->effective_effect_id;
        mode.effective_params = parent->effective_params;
        mode.effective_from = parent->effective_from;
    } else {
        mode.effective_effect_id.reset();
        mode.effective_params.reset();
        mode.effective_from.reset();
    }
}

void resolve_brightness(ScopeBrightnessState& brightness, const ScopeRef& self,
                        const ScopeBrightnessState* parent) {
    if (parent && brightness.is_following) {
        brightness.effective_value = parent->effective_value;
        brightness.effective_from = parent->effective_from;
        return;
    }

    if (!parent) {
        brightness.is_following = false;
    }
    brightness.effective_value = std::clamp(brightness.value, 0, 100);
    brightness.effective_from = self;
}
}  // namespace

namespace core {
const Device* find_device(const std::vector<Device>& devices, const std::string& port) {
    auto it = std::find_if(devices.begin(), devices.end(), [&port](const Device& d) { return d.port == port; });
    return it == devices.end() ? nullptr : &*it;
}

const OutputPort* find_output(const Device& device, const std::string& output_id) {
    auto it = std::find_if(device.outputs.begin(), device.outputs.end(),
                           [&output_id](const OutputPort& o) { return o.id == output_id; });
    return it == device.outputs.end() ? nullptr : &*it;
}

const Segment* find_segment(const OutputPort& output, const std::string& segment_id) {
    auto it = std::find_if(output.segments.begin(), output.segments.end(),
                           [&segment_id](const Segment& s) { return s.id == segment_id; });
    return it == output.segments.end() ? nullptr : &*it;
}

ScopeRef normalize_scope(const ScopeRef& scope, const std::vector<Device>& devices) {
    const Device* device = find_device(devices, scope.port);
    if (!device) {
        return scope;
    }

    // A device with one output and that output are the same control point.
    if (!scope.output_id && device->outputs.size() == 1) {
        return output_scope(scope.port, device->outputs.front().id);
    }

    if (!scope.output_id) {
        return device_scope(scope.port);
    }

    const OutputPort* output = find_output(*device, *scope.output_id);
    if (!output) {
        if (device->outputs.size() == 1) {
            return output_scope(scope.port, device->outputs.front().id);
        }
        return device_scope(scope.port);
    }

    if (scope.segment_id && !find_segment(*output, *scope.segment_id)) {
        return output_scope(scope.port, output->id);
    }

    return scope;
}

ControlState control_state_from_mode(const ScopeModeState& mode) {
    if (!mode.effective_effect_id) {
        return ControlState::None;
    }
    if (mode.selected_effect_id) {
        return ControlState::Explicit;
    }
    return ControlState::Inherited;
}

const char* control_state_name(ControlState state) {
    switch (state) {
        case ControlState::Explicit: return "explicit";
        case ControlState::Inherited: return "inherited";
        case ControlState::None: return "none";
    }
    return "none";
}

std::string node_id_for_scope(const ScopeRef& scope) {
    if (scope.output_id && scope.segment_id) {
        return "seg:" + scope.port + ":" + *scope.output_id + ":" + *scope.segment_id;
    }
    if (scope.output_id) {
        return "out:" + scope.port + ":" + *scope.output_id;
    }
    return "dev:" + scope.port;
}

std::vector<std::string> expanded_node_ids(const ScopeRef& scope) {
    std::vector<std::string> ids;
    ids.push_back("dev:" + scope.port);
    if (scope.output_id) {
        ids.push_back("out:" + scope.port + ":" + *scope.output_id);
        if (scope.segment_id) {
            ids.push_back("seg:" + scope.port + ":" + *scope.output_id + ":" + *scope.segment_id);
        }
    }
    return ids;
}

const ScopeModeState* mode_for_scope(const Device& device, const ScopeRef& scope) {
    if (!scope.output_id) {
        return &device.mode;
    }
    const OutputPort* output = find_output(device, *scope.output_id);
    if (!output) {
        return nullptr;
    }
    if (!scope.segment_id) {
        return &output->mode;
    }
    const Segment* segment = find_segment(*output, *scope.segment_id);
    return segment ? &segment->mode : nullptr;
}

const ScopeBrightnessState* brightness_for_scope(const Device& device, const ScopeRef& scope) {
    if (!scope.output_id) {
        return &device.brightness;
    }
    const OutputPort* output = find_output(device, *scope.output_id);
    if (!output) {
        return nullptr;
    }
    if (!scope.segment_id) {
        return &output->brightness;
    }
    const Segment* segment = find_segment(*output, *scope.segment_id);
    return segment ? &segment->brightness : nullptr;
}

std::string scope_display_title(const Device& device, const ScopeRef& scope) {
    std::string title = device.model.empty() ? device.port : device.model;
    if (!scope.output_id) {
        return title;
    }

    const OutputPort* output = find_output(device, *scope.output_id);
    if (!output) {
        return title;
    }
    if (device.outputs.size() > 1) {
        title += " / " + output->name;
    }

    if (scope.segment_id) {
        if (const Segment* segment = find_segment(*output, *scope.segment_id)) {
            title += " / " + segment->name;
        }
    }
    return title;
}

void resolve_scope_inheritance(Device& device) {
    const ScopeRef device_ref = device_scope(device.port);
    resolve_mode(device.mode, device_ref, nullptr);
    resolve_brightness(device.brightness, device_ref, nullptr);

    for (auto& output : device.outputs) {
        const ScopeRef output_ref = output_scope(device.port, output.id);
        resolve_mode(output.mode, output_ref, &device.mode);
        resolve_brightness(output.brightness, output_ref, &device.brightness);

        for (auto& segment : output.segments) {
            const ScopeRef segment_ref = segment_scope(device.port, output.id, segment.id);
            resolve_mode(segment.mode, segment_ref, &output.mode);
            resolve_brightness(segment.brightness, segment_ref, &output.brightness);
        }
    }
}
}  // namespace core
