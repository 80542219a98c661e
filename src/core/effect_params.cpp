#include "core/effect_params.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

namespace {
constexpr double kEpsilon = std::numeric_limits<double>::epsilon();

bool same_value(double lhs, double rhs) {
    return std::fabs(lhs - rhs) < kEpsilon;
}

bool has_option(const EffectParam& param, double value) {
    for (const auto& option : param.options) {
        if (same_value(option.value, value)) {
            return true;
        }
    }
    return false;
}

double select_fallback(const EffectParam& param) {
    if (param.options.empty() || has_option(param, param.default_value)) {
        return param.default_value;
    }
    return param.options.front().value;
}

core::ParamAvailability unmet(ParamDependencyBehavior behavior) {
    core::ParamAvailability availability;
    if (behavior == ParamDependencyBehavior::Hide) {
        availability.visible = false;
    } else {
        availability.disabled = true;
    }
    return availability;
}
}  // namespace

namespace core {
const EffectInfo* find_effect(const std::vector<EffectInfo>& effects, const std::string& id) {
    for (const auto& effect : effects) {
        if (effect.id == id) {
            return &effect;
        }
    }
    return nullptr;
}

const EffectParam* find_param(const EffectInfo& effect, const std::string& key) {
    for (const auto& param : effect.params) {
        if (param.key == key) {
            return &param;
        }
    }
    return nullptr;
}

double param_number(const EffectParam& param, const EffectParams& values) {
    auto it = values.find(param.key);
    const EffectParamValue* stored = it == values.end() ? nullptr : &it->second;

    if (param.kind == EffectParamKind::Toggle) {
        if (stored) {
            if (const auto* flag = std::get_if<bool>(stored)) {
                return *flag ? 1.0 : 0.0;
            }
            if (const auto* number = std::get_if<double>(stored)) {
                return same_value(*number, 0.0) ? 0.0 : 1.0;
            }
        }
        return same_value(param.default_value, 0.0) ? 0.0 : 1.0;
    }

    std::optional<double> value;
    if (stored) {
        if (const auto* number = std::get_if<double>(stored)) {
            value = *number;
        } else if (const auto* flag = std::get_if<bool>(stored)) {
            value = *flag ? 1.0 : 0.0;
        }
    }

    if (param.kind == EffectParamKind::Select) {
        if (value && (param.options.empty() || has_option(param, *value))) {
            return *value;
        }
        return select_fallback(param);
    }
    return value.value_or(param.default_value);
}

EffectParamValue param_value(const EffectParam& param, const EffectParams& values) {
    const double number = param_number(param, values);
    if (param.kind == EffectParamKind::Toggle) {
        return !same_value(number, 0.0);
    }
    return number;
}

ParamAvailability param_availability(const EffectInfo& effect, const EffectParam& param,
                                     const EffectParams& values) {
    if (!param.dependency) {
        return ParamAvailability();
    }
    const ParamDependency& dependency = *param.dependency;
    if (!dependency.key) {
        return unmet(dependency.behavior);
    }

    const EffectParam* controlling = find_param(effect, *dependency.key);
    if (!controlling) {
        return ParamAvailability();
    }

    const double value = param_number(*controlling, values);
    bool met = true;
    if (dependency.equals && !same_value(value, *dependency.equals)) {
        met = false;
    }
    if (dependency.not_equals && same_value(value, *dependency.not_equals)) {
        met = false;
    }
    return met ? ParamAvailability() : unmet(dependency.behavior);
}

double snap_slider_value(const EffectParam& param, double value) {
    const double lo = std::min(param.min, param.max);
    const double hi = std::max(param.min, param.max);
    double snapped = std::clamp(value, lo, hi);
    if (param.step > 0.0) {
        snapped = lo + std::round((snapped - lo) / param.step) * param.step;
    }
    return std::clamp(snapped, lo, hi);
}

std::string format_param_value(const EffectParam& param, double value) {
    if (param.step < 1.0) {
        std::ostringstream out;
        out << std::fixed << std::setprecision(1) << value;
        return out.str();
    }
    return std::to_string(std::llround(value));
}

const char* param_kind_to_string(EffectParamKind kind) {
    switch (kind) {
        case EffectParamKind::Slider: return "slider";
        case EffectParamKind::Select: return "select";
        case EffectParamKind::Toggle: return "toggle";
    }
    return "slider";
}

bool param_kind_from_string(const std::string& text, EffectParamKind& kind) {
    if (text == "slider") {
        kind = EffectParamKind::Slider;
    } else if (text == "select") {
        kind = EffectParamKind::Select;
    } else if (text == "toggle") {
        kind = EffectParamKind::Toggle;
    } else {
        return false;
    }
    return true;
}
}  // namespace core
