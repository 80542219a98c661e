#ifndef DEVICES_CONTROLLER_HPP
#define DEVICES_CONTROLLER_HPP

#include "core/models.hpp"
#include "platform/lightdesk_backend.hpp"

#include <optional>
#include <string>
#include <vector>

class DevicesController {
public:
    explicit DevicesController(LightdeskBackend& backend);

    // Both replace the snapshot and keep the selection when its device survives.
    bool rescan();
    bool refresh();
    bool load_effects();

    const std::vector<Device>& devices() const;
    const std::vector<EffectInfo>& effects() const;
    const Device* find_device(const std::string& port) const;

    const std::optional<ScopeRef>& selected_scope() const;
    const Device* selected_device() const;
    void select_scope(const ScopeRef& scope);

    // Sent to the daemon, then mirrored into the local snapshot.
    bool set_scope_effect(const ScopeRef& scope, const std::optional<std::string>& effect_id);
    bool set_scope_brightness(const ScopeRef& scope, int brightness);
    bool update_scope_effect_params(const ScopeRef& scope, const EffectParams& params);

    const std::string& status_message() const;
    bool status_is_error() const;

private:
    bool apply_snapshot(DeviceSnapshot snapshot);
    Device* mutable_device(const std::string& port);
    void set_status(std::string text, bool is_error);

    LightdeskBackend& m_backend;
    std::vector<Device> m_devices;
    std::vector<EffectInfo> m_effects;
    std::optional<ScopeRef> m_selected;
    std::string m_status;
    bool m_status_error = false;
};

#endif
