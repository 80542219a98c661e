#include "ui/scope_controls_panel.hpp"

#include "core/effect_params.hpp"
#include "core/scope.hpp"

#include <algorithm>
#include <cmath>

namespace {
std::string effect_name(const std::vector<EffectInfo>& effects, const std::string& id) {
    for (const auto& effect : effects) {
        if (effect.id == id) {
            return effect.name;
        }
    }
    return id;
}

guint option_index(const EffectParam& param, double value) {
    for (guint i = 0; i < param.options.size(); ++i) {
        if (std::fabs(param.options[i].value - value) < 1e-9) {
            return i;
        }
    }
    return 0;
}
}  // namespace

namespace ui {
ScopeControlsPanel::ScopeControlsPanel(
    const std::function<void(const std::optional<std::string>&)>& on_effect_chosen,
    const std::function<void(int)>& on_brightness_changed,
    const ParamChanged& on_param_changed)
    : m_on_param_changed(on_param_changed) {
    m_root = Gtk::make_managed<Gtk::Box>(Gtk::Orientation::VERTICAL);
    m_root->set_spacing(10);

    m_title = Gtk::make_managed<Gtk::Label>("No device selected");
    m_title->add_css_class("section-title");
    m_title->set_halign(Gtk::Align::START);
    m_root->append(*m_title);

    m_state = Gtk::make_managed<Gtk::Label>("");
    m_state->add_css_class("scope-state");
    m_state->set_halign(Gtk::Align::START);
    m_root->append(*m_state);

    auto effectFrame = Gtk::make_managed<Gtk::Frame>("Effect");
    auto effectBox = Gtk::make_managed<Gtk::Box>(Gtk::Orientation::HORIZONTAL);
    effectBox->set_spacing(5);
    effectBox->set_margin(10);

    m_effect_model = Gtk::StringList::create();
    m_effect = Gtk::make_managed<Gtk::DropDown>();
    m_effect->set_model(m_effect_model);
    m_effect->set_hexpand(true);
    m_effect->property_selected().signal_changed().connect([this, on_effect_chosen]() {
        if (m_updating) {
            return;
        }
        auto index = m_effect->get_selected();
        if (index == GTK_INVALID_LIST_POSITION || index >= m_effect_ids.size()) {
            return;
        }
        on_effect_chosen(m_effect_ids[index]);
    });
    effectBox->append(*m_effect);
    effectFrame->set_child(*effectBox);
    m_root->append(*effectFrame);

    auto brightnessFrame = Gtk::make_managed<Gtk::Frame>("Brightness");
    auto brightnessBox = Gtk::make_managed<Gtk::Box>(Gtk::Orientation::VERTICAL);
    brightnessBox->set_spacing(5);
    brightnessBox->set_margin(10);

    m_brightness = Gtk::make_managed<Gtk::Scale>(Gtk::Adjustment::create(100.0, 0.0, 100.0, 1.0, 10.0),
                                                 Gtk::Orientation::HORIZONTAL);
    m_brightness->set_digits(0);
    m_brightness->set_draw_value(true);
    m_brightness->set_hexpand(true);
    m_brightness->signal_value_changed().connect([this, on_brightness_changed]() {
        if (m_updating) {
            return;
        }
        on_brightness_changed(static_cast<int>(std::lround(m_brightness->get_value())));
    });
    brightnessBox->append(*m_brightness);

    m_brightness_note = Gtk::make_managed<Gtk::Label>("");
    m_brightness_note->set_halign(Gtk::Align::START);
    m_brightness_note->add_css_class("dim-label");
    brightnessBox->append(*m_brightness_note);

    brightnessFrame->set_child(*brightnessBox);
    m_root->append(*brightnessFrame);

    m_params_frame = Gtk::make_managed<Gtk::Frame>("Parameters");
    m_params_box = Gtk::make_managed<Gtk::Box>(Gtk::Orientation::VERTICAL);
    m_params_box->set_spacing(8);
    m_params_box->set_margin(10);
    m_params_frame->set_child(*m_params_box);
    m_root->append(*m_params_frame);

    clear();
}

Gtk::Box* ScopeControlsPanel::widget() const {
    return m_root;
}

void ScopeControlsPanel::clear() {
    m_updating = true;
    m_title->set_text("No device selected");
    m_state->set_text("");
    m_effect_model->splice(0, m_effect_model->get_n_items(), {});
    m_effect_ids.clear();
    m_brightness->set_value(100.0);
    m_brightness_note->set_text("");
    m_effect->set_sensitive(false);
    m_brightness->set_sensitive(false);
    clear_params();
    m_updating = false;
}

void ScopeControlsPanel::show_scope(const Device& device, const ScopeRef& scope,
                                    const std::vector<EffectInfo>& effects) {
    const ScopeModeState* mode = core::mode_for_scope(device, scope);
    const ScopeBrightnessState* brightness = core::brightness_for_scope(device, scope);
    if (!mode || !brightness) {
        clear();
        return;
    }

    m_updating = true;
    m_title->set_text(core::scope_display_title(device, scope));

    const core::ControlState state = core::control_state_from_mode(*mode);
    std::string stateText = "No effect";
    if (mode->effective_effect_id) {
        const std::string name = effect_name(effects, *mode->effective_effect_id);
        stateText = state == core::ControlState::Explicit ? "Effect: " + name : "Inherited: " + name;
    }
    m_state->set_text(stateText);

    m_effect_ids.clear();
    std::vector<Glib::ustring> labels;
    const bool isRoot = !scope.output_id;
    labels.push_back(isRoot ? "None" : "Inherit");
    m_effect_ids.push_back(std::nullopt);
    for (const auto& effect : effects) {
        labels.push_back(effect.group.empty() ? effect.name : effect.group + " / " + effect.name);
        m_effect_ids.push_back(effect.id);
    }
    m_effect_model->splice(0, m_effect_model->get_n_items(), labels);

    guint selected = 0;
    if (mode->selected_effect_id) {
        for (guint i = 1; i < m_effect_ids.size(); ++i) {
            if (m_effect_ids[i] == mode->selected_effect_id) {
                selected = i;
                break;
            }
        }
    }
    m_effect->set_selected(selected);
    m_effect->set_sensitive(true);

    m_brightness->set_value(brightness->effective_value);
    m_brightness->set_sensitive(true);
    if (brightness->is_following) {
        m_brightness_note->set_text("Following parent (" + std::to_string(brightness->effective_value) + "%)");
    } else {
        m_brightness_note->set_text("");
    }
    m_updating = false;

    // Parameters belong to the effect in force here; only a scope that chose
    // it itself may change them.
    const EffectInfo* effect =
        mode->effective_effect_id ? core::find_effect(effects, *mode->effective_effect_id) : nullptr;
    const std::string signature =
        core::node_id_for_scope(scope) + "|" + mode->effective_effect_id.value_or("");
    show_params(effect, mode->effective_params.value_or(EffectParams()), state == core::ControlState::Explicit,
                signature);
}

void ScopeControlsPanel::show_params(const EffectInfo* effect, const EffectParams& values, bool editable,
                                     const std::string& signature) {
    if (!effect || effect->params.empty()) {
        clear_params();
        return;
    }

    if (signature != m_param_signature || !m_param_effect) {
        clear_params();
        m_param_effect = *effect;
        m_param_signature = signature;
        build_params(*m_param_effect);
    }

    m_param_values = values;
    m_params_editable = editable;
    sync_params();
    refresh_param_availability();
    m_params_frame->set_visible(true);
}

void ScopeControlsPanel::clear_params() {
    while (auto child = m_params_box->get_first_child()) {
        m_params_box->remove(*child);
    }
    m_param_rows.clear();
    m_param_effect.reset();
    m_param_values.clear();
    m_param_signature.clear();
    m_params_editable = false;
    m_params_frame->set_visible(false);
}

void ScopeControlsPanel::build_params(const EffectInfo& effect) {
    for (const auto& param : effect.params) {
        ParamRow entry;
        entry.key = param.key;
        const std::string key = param.key;

        auto label = Gtk::make_managed<Gtk::Label>(param.label);
        label->set_halign(Gtk::Align::START);
        label->set_hexpand(true);

        switch (param.kind) {
        case EffectParamKind::Slider: {
            entry.row = Gtk::make_managed<Gtk::Box>(Gtk::Orientation::VERTICAL);
            auto header = Gtk::make_managed<Gtk::Box>(Gtk::Orientation::HORIZONTAL);
            header->append(*label);
            entry.value_label = Gtk::make_managed<Gtk::Label>("");
            entry.value_label->add_css_class("dim-label");
            header->append(*entry.value_label);
            entry.row->append(*header);

            const double lo = std::min(param.min, param.max);
            const double hi = std::max(param.min, param.max);
            entry.scale = Gtk::make_managed<Gtk::Scale>(
                Gtk::Adjustment::create(lo, lo, hi, param.step, param.step * 10.0), Gtk::Orientation::HORIZONTAL);
            entry.scale->set_digits(param.step < 1.0 ? 1 : 0);
            entry.scale->set_draw_value(false);
            entry.scale->set_hexpand(true);
            Gtk::Scale* scale = entry.scale;
            Gtk::Label* valueLabel = entry.value_label;
            scale->signal_value_changed().connect([this, key, scale, valueLabel]() {
                if (m_updating || !m_param_effect) {
                    return;
                }
                const EffectParam* current = core::find_param(*m_param_effect, key);
                if (!current) {
                    return;
                }
                const double value = core::snap_slider_value(*current, scale->get_value());
                valueLabel->set_text(core::format_param_value(*current, value));
                emit_param(key, value);
            });
            entry.row->append(*entry.scale);
            break;
        }
        case EffectParamKind::Select: {
            entry.row = Gtk::make_managed<Gtk::Box>(Gtk::Orientation::HORIZONTAL);
            entry.row->set_spacing(5);
            entry.row->append(*label);
            if (param.options.empty()) {
                auto empty = Gtk::make_managed<Gtk::Label>("No options available");
                empty->add_css_class("dim-label");
                entry.row->append(*empty);
                break;
            }

            auto model = Gtk::StringList::create();
            for (const auto& option : param.options) {
                model->append(option.label);
            }
            entry.choice = Gtk::make_managed<Gtk::DropDown>();
            entry.choice->set_model(model);
            Gtk::DropDown* choice = entry.choice;
            choice->property_selected().signal_changed().connect([this, key, choice]() {
                if (m_updating || !m_param_effect) {
                    return;
                }
                const EffectParam* current = core::find_param(*m_param_effect, key);
                const auto index = choice->get_selected();
                if (!current || index == GTK_INVALID_LIST_POSITION || index >= current->options.size()) {
                    return;
                }
                emit_param(key, current->options[index].value);
            });
            entry.row->append(*entry.choice);
            break;
        }
        case EffectParamKind::Toggle: {
            entry.row = Gtk::make_managed<Gtk::Box>(Gtk::Orientation::HORIZONTAL);
            entry.row->set_spacing(5);
            entry.row->append(*label);
            entry.toggle = Gtk::make_managed<Gtk::Switch>();
            entry.toggle->set_valign(Gtk::Align::CENTER);
            Gtk::Switch* toggle = entry.toggle;
            toggle->property_active().signal_changed().connect([this, key, toggle]() {
                if (m_updating) {
                    return;
                }
                emit_param(key, static_cast<bool>(toggle->get_active()));
            });
            entry.row->append(*entry.toggle);
            break;
        }
        }

        m_params_box->append(*entry.row);
        m_param_rows.push_back(entry);
    }
}

void ScopeControlsPanel::sync_params() {
    if (!m_param_effect) {
        return;
    }
    m_updating = true;
    for (const auto& entry : m_param_rows) {
        const EffectParam* param = core::find_param(*m_param_effect, entry.key);
        if (!param) {
            continue;
        }
        const double value = core::param_number(*param, m_param_values);
        if (entry.scale) {
            entry.scale->set_value(value);
            entry.value_label->set_text(core::format_param_value(*param, value));
        } else if (entry.choice) {
            entry.choice->set_selected(option_index(*param, value));
        } else if (entry.toggle) {
            entry.toggle->set_active(value != 0.0);
        }
    }
    m_updating = false;
}

void ScopeControlsPanel::refresh_param_availability() {
    if (!m_param_effect) {
        return;
    }
    for (const auto& entry : m_param_rows) {
        const EffectParam* param = core::find_param(*m_param_effect, entry.key);
        if (!param) {
            continue;
        }
        const core::ParamAvailability availability =
            core::param_availability(*m_param_effect, *param, m_param_values);
        entry.row->set_visible(availability.visible);
        entry.row->set_sensitive(m_params_editable && !availability.disabled);
    }
}

void ScopeControlsPanel::emit_param(const std::string& key, const EffectParamValue& value) {
    m_param_values[key] = value;
    refresh_param_availability();
    m_on_param_changed(key, value);
}
}  // namespace ui
