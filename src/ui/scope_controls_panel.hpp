#ifndef UI_SCOPE_CONTROLS_PANEL_HPP
#define UI_SCOPE_CONTROLS_PANEL_HPP

#include "core/models.hpp"

#include <gtkmm.h>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ui {
class ScopeControlsPanel {
public:
    using ParamChanged = std::function<void(const std::string&, const EffectParamValue&)>;

    ScopeControlsPanel(
        const std::function<void(const std::optional<std::string>&)>& on_effect_chosen,
        const std::function<void(int)>& on_brightness_changed,
        const ParamChanged& on_param_changed);

    Gtk::Box* widget() const;

    void show_scope(const Device& device, const ScopeRef& scope, const std::vector<EffectInfo>& effects);
    void clear();

private:
    // Widgets for one effect parameter; only the one matching its kind is set.
    struct ParamRow {
        std::string key;
        Gtk::Box* row = nullptr;
        Gtk::Scale* scale = nullptr;
        Gtk::Label* value_label = nullptr;
        Gtk::DropDown* choice = nullptr;
        Gtk::Switch* toggle = nullptr;
    };

    void show_params(const EffectInfo* effect, const EffectParams& values, bool editable,
                     const std::string& signature);
    void build_params(const EffectInfo& effect);
    void clear_params();
    void sync_params();
    void refresh_param_availability();
    void emit_param(const std::string& key, const EffectParamValue& value);

    Gtk::Box* m_root = nullptr;
    Gtk::Label* m_title = nullptr;
    Gtk::Label* m_state = nullptr;
    Gtk::DropDown* m_effect = nullptr;
    Glib::RefPtr<Gtk::StringList> m_effect_model;
    Gtk::Scale* m_brightness = nullptr;
    Gtk::Label* m_brightness_note = nullptr;

    Gtk::Frame* m_params_frame = nullptr;
    Gtk::Box* m_params_box = nullptr;
    ParamChanged m_on_param_changed;

    // Parallel to m_effect_model; the first entry is "inherit".
    std::vector<std::optional<std::string>> m_effect_ids;

    std::optional<EffectInfo> m_param_effect;
    std::vector<ParamRow> m_param_rows;
    EffectParams m_param_values;
    std::string m_param_signature;
    bool m_params_editable = false;
    bool m_updating = false;
};
}  // namespace ui

#endif
