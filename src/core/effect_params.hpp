#ifndef CORE_EFFECT_PARAMS_HPP
#define CORE_EFFECT_PARAMS_HPP

#include "core/models.hpp"

#include <string>
#include <vector>

namespace core {
struct ParamAvailability {
    bool visible = true;
    bool disabled = false;
};

const EffectInfo* find_effect(const std::vector<EffectInfo>& effects, const std::string& id);
const EffectParam* find_param(const EffectInfo& effect, const std::string& key);

// The stored value when present, else the declared default. Sliders and
// selects yield a double, toggles a bool.
EffectParamValue param_value(const EffectParam& param, const EffectParams& values);
double param_number(const EffectParam& param, const EffectParams& values);

// Whether a parameter is shown and editable given the current values of the
// parameters it depends on.
ParamAvailability param_availability(const EffectInfo& effect, const EffectParam& param,
                                     const EffectParams& values);

double snap_slider_value(const EffectParam& param, double value);
std::string format_param_value(const EffectParam& param, double value);

const char* param_kind_to_string(EffectParamKind kind);
bool param_kind_from_string(const std::string& text, EffectParamKind& kind);
}  // namespace core

#endif
