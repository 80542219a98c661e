#include "features/devices_controller.hpp"

#include "core/logging.hpp"
#include "core/scope.hpp"

#include <algorithm>
#include <utility>

namespace {
ScopeModeState* mode_for(Device& device, const ScopeRef& scope) {
    if (!scope.output_id) {
        return &device.mode;
    }
    for (auto& output : device.outputs) {
        if (output.id != *scope.output_id) {
            continue;
        }
        if (!scope.segment_id) {
            return &output.mode;
        }
        for (auto& segment : output.segments) {
            if (segment.id == *scope.segment_id) {
                return &segment.mode;
            }
        }
    }
    return nullptr;
}

ScopeBrightnessState* brightness_for(Device& device, const ScopeRef& scope) {
    if (!scope.output_id) {
        return &device.brightness;
    }
    for (auto& output : device.outputs) {
        if (output.id != *scope.output_id) {
            continue;
        }
        if (!scope.segment_id) {
            return &output.brightness;
        }
        for (auto& segment : output.segments) {
            if (segment.id == *scope.segment_id) {
                return &segment.brightness;
            }
        }
    }
    return nullptr;
}
}  // namespace

DevicesController::DevicesController(LightdeskBackend& backend)
    : m_backend(backend) {}

bool DevicesController::rescan() {
    return apply_snapshot(m_backend.scan_devices());
}

bool DevicesController::refresh() {
    return apply_snapshot(m_backend.get_devices());
}

bool DevicesController::load_effects() {
    std::string error;
    std::vector<EffectInfo> effects;
    if (!m_backend.get_effects(effects, error)) {
        logging::warn("effects.load_failed", {{"error", error}});
        set_status("Failed to load effects: " + error, true);
        return false;
    }
    m_effects = std::move(effects);
    return true;
}

bool DevicesController::apply_snapshot(DeviceSnapshot snapshot) {
    if (!snapshot.ok) {
        logging::error("devices.scan_failed", {{"error", snapshot.error}});
        set_status("Error scanning devices", true);
        return false;
    }

    m_devices = std::move(snapshot.devices);
    for (auto& device : m_devices) {
        core::resolve_scope_inheritance(device);
    }

    if (m_selected && core::find_device(m_devices, m_selected->port)) {
        m_selected = core::normalize_scope(*m_selected, m_devices);
    } else if (!m_devices.empty()) {
        m_selected = core::normalize_scope(ScopeRef{m_devices.front().port, std::nullopt, std::nullopt}, m_devices);
    } else {
        m_selected.reset();
    }

    if (m_devices.empty()) {
        set_status("No devices found", false);
    } else {
        set_status("Found " + std::to_string(m_devices.size()) + " device(s)", false);
    }
    logging::info("devices.loaded", {{"count", std::to_string(m_devices.size())}});
    return true;
}

const std::vector<Device>& DevicesController::devices() const {
    return m_devices;
}

const std::vector<EffectInfo>& DevicesController::effects() const {
    return m_effects;
}

const Device* DevicesController::find_device(const std::string& port) const {
    return core::find_device(m_devices, port);
}

const std::optional<ScopeRef>& DevicesController::selected_scope() const {
    return m_selected;
}

const Device* DevicesController::selected_device() const {
    return m_selected ? core::find_device(m_devices, m_selected->port) : nullptr;
}

void DevicesController::select_scope(const ScopeRef& scope) {
    m_selected = core::normalize_scope(scope, m_devices);
}

Device* DevicesController::mutable_device(const std::string& port) {
    auto it = std::find_if(m_devices.begin(), m_devices.end(), [&port](const Device& d) { return d.port == port; });
    return it == m_devices.end() ? nullptr : &*it;
}

bool DevicesController::set_scope_effect(const ScopeRef& scope, const std::optional<std::string>& effect_id) {
    std::string error;
    if (!m_backend.set_scope_effect(scope, effect_id, error)) {
        logging::warn("scope.set_effect_failed", {{"node", core::node_id_for_scope(scope)}, {"error", error}});
        set_status("Failed to set effect: " + error, true);
        return false;
    }

    if (Device* device = mutable_device(scope.port)) {
        if (ScopeModeState* mode = mode_for(*device, scope)) {
            mode->selected_effect_id = effect_id;
            core::resolve_scope_inheritance(*device);
        }
    }
    set_status(effect_id ? "Effect set to " + *effect_id : std::string("Effect now inherited"), false);
    return true;
}

bool DevicesController::set_scope_brightness(const ScopeRef& scope, int brightness) {
    const int value = std::clamp(brightness, 0, 100);
    std::string error;
    if (!m_backend.set_scope_brightness(scope, value, error)) {
        logging::warn("scope.set_brightness_failed", {{"node", core::node_id_for_scope(scope)}, {"error", error}});
        set_status("Failed to set brightness: " + error, true);
        return false;
    }

    if (Device* device = mutable_device(scope.port)) {
        if (ScopeBrightnessState* state = brightness_for(*device, scope)) {
            state->value = value;
            state->is_following = false;
            core::resolve_scope_inheritance(*device);
        }
    }
    set_status("Brightness set to " + std::to_string(value) + "%", false);
    return true;
}

bool DevicesController::update_scope_effect_params(const ScopeRef& scope, const EffectParams& params) {
    std::string error;
    if (!m_backend.update_scope_effect_params(scope, params, error)) {
        logging::warn("scope.update_params_failed", {{"node", core::node_id_for_scope(scope)}, {"error", error}});
        set_status("Failed to update effect parameters: " + error, true);
        return false;
    }

    if (Device* device = mutable_device(scope.port)) {
        ScopeModeState* mode = mode_for(*device, scope);
        if (mode && mode->effective_from && *mode->effective_from == scope) {
            EffectParams merged = mode->effective_params.value_or(EffectParams());
            for (const auto& param : params) {
                merged[param.first] = param.second;
            }
            mode->effective_params = std::move(merged);
            core::resolve_scope_inheritance(*device);
        }
    }
    set_status("Effect parameters updated", false);
    return true;
}

const std::string& DevicesController::status_message() const {
    return m_status;
}

bool DevicesController::status_is_error() const {
    return m_status_error;
}

void DevicesController::set_status(std::string text, bool is_error) {
    m_status = std::move(text);
    m_status_error = is_error;
}
