#ifndef CORE_MODELS_HPP
#define CORE_MODELS_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

enum class SegmentType {
    Single,
    Linear,
    Matrix
};

enum class DeviceType {
    Motherboard,
    Dram,
    Gpu,
    Cooler,
    LedStrip,
    Keyboard,
    Mouse,
    MouseMat,
    Headset,
    HeadsetStand,
    Gamepad,
    Light,
    Speaker,
    Virtual,
    Storage,
    Case,
    Microphone,
    Accessory,
    Keypad,
    Laptop,
    Monitor,
    Unknown
};

struct LedColor {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
};

inline bool operator==(const LedColor& lhs, const LedColor& rhs) {
    return lhs.r == rhs.r && lhs.g == rhs.g && lhs.b == rhs.b;
}

inline bool operator!=(const LedColor& lhs, const LedColor& rhs) {
    return !(lhs == rhs);
}

struct LedFrame {
    std::string port;
    std::vector<LedColor> colors;
};

// Cells without a physical LED hold no value.
struct MatrixMap {
    int width = 0;
    int height = 0;
    std::vector<std::optional<int>> map;
};

struct ScopeRef {
    std::string port;
    std::optional<std::string> output_id;
    std::optional<std::string> segment_id;
};

inline bool operator==(const ScopeRef& lhs, const ScopeRef& rhs) {
    return lhs.port == rhs.port && lhs.output_id == rhs.output_id && lhs.segment_id == rhs.segment_id;
}

inline bool operator!=(const ScopeRef& lhs, const ScopeRef& rhs) {
    return !(lhs == rhs);
}

using EffectParamValue = std::variant<double, bool, std::string>;
using EffectParams = std::map<std::string, EffectParamValue>;

struct ScopeModeState {
    // Explicit choice at this node; empty means inherit.
    std::optional<std::string> selected_effect_id;
    // Resolved after inheritance; empty means off.
    std::optional<std::string> effective_effect_id;
    std::optional<EffectParams> effective_params;
    std::optional<ScopeRef> effective_from;
};

struct ScopeBrightnessState {
    int value = 100;
    int effective_value = 100;
    std::optional<ScopeRef> effective_from;
    bool is_following = false;
};

struct OutputCapabilities {
    bool editable = false;
    int min_total_leds = 0;
    int max_total_leds = 0;
    std::vector<int> allowed_total_leds;
    std::vector<SegmentType> allowed_segment_types;
};

struct Segment {
    std::string id;
    std::string name;
    SegmentType segment_type = SegmentType::Linear;
    int leds_count = 0;
    std::optional<MatrixMap> matrix;
    ScopeModeState mode;
    ScopeBrightnessState brightness;
};

struct OutputPort {
    std::string id;
    std::string name;
    SegmentType output_type = SegmentType::Linear;
    int leds_count = 0;
    std::optional<MatrixMap> matrix;
    OutputCapabilities capabilities;
    ScopeModeState mode;
    ScopeBrightnessState brightness;
    std::vector<Segment> segments;
};

struct Device {
    std::string port;
    std::string model;
    std::string description;
    std::string id;
    DeviceType device_type = DeviceType::Unknown;
    ScopeBrightnessState brightness;
    ScopeModeState mode;
    std::vector<OutputPort> outputs;
};

enum class EffectParamKind {
    Slider,
    Select,
    Toggle
};

enum class ParamDependencyBehavior {
    Hide,
    Disable
};

// Without a key the behavior applies unconditionally.
struct ParamDependency {
    std::optional<std::string> key;
    std::optional<double> equals;
    std::optional<double> not_equals;
    ParamDependencyBehavior behavior = ParamDependencyBehavior::Disable;
};

struct SelectOption {
    std::string label;
    double value = 0.0;
};

struct EffectParam {
    std::string key;
    std::string label;
    EffectParamKind kind = EffectParamKind::Slider;
    double min = 0.0;
    double max = 1.0;
    double step = 1.0;
    // Toggles keep their default as 0 or 1.
    double default_value = 0.0;
    std::vector<SelectOption> options;
    std::optional<ParamDependency> dependency;
};

struct EffectInfo {
    std::string id;
    std::string name;
    std::string description;
    std::string group;
    std::vector<EffectParam> params;
};

struct DeviceSnapshot {
    bool ok = false;
    std::string error;
    std::vector<Device> devices;
};

#endif
