#include "platform/lightdesk_backend.hpp"

#include "core/effect_params.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <json-glib/json-glib.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>
#include <utility>

namespace {
constexpr int kRequestTimeoutSeconds = 5;
// Upper bounds for daemon-reported sizes; larger values are clamped.
constexpr int kMaxLedCount = 1 << 20;
constexpr int kMaxMatrixSide = 4096;

struct DeviceTypeName {
    DeviceType type;
    const char* name;
};

const DeviceTypeName kDeviceTypeNames[] = {
    {DeviceType::Motherboard, "Motherboard"},
    {DeviceType::Dram, "Dram"},
    {DeviceType::Gpu, "Gpu"},
    {DeviceType::Cooler, "Cooler"},
    {DeviceType::LedStrip, "LedStrip"},
    {DeviceType::Keyboard, "Keyboard"},
    {DeviceType::Mouse, "Mouse"},
    {DeviceType::MouseMat, "MouseMat"},
    {DeviceType::Headset, "Headset"},
    {DeviceType::HeadsetStand, "HeadsetStand"},
    {DeviceType::Gamepad, "Gamepad"},
    {DeviceType::Light, "Light"},
    {DeviceType::Speaker, "Speaker"},
    {DeviceType::Virtual, "Virtual"},
    {DeviceType::Storage, "Storage"},
    {DeviceType::Case, "Case"},
    {DeviceType::Microphone, "Microphone"},
    {DeviceType::Accessory, "Accessory"},
    {DeviceType::Keypad, "Keypad"},
    {DeviceType::Laptop, "Laptop"},
    {DeviceType::Monitor, "Monitor"},
    {DeviceType::Unknown, "Unknown"},
};

// --- decoding helpers -------------------------------------------------------

JsonNode* value_member(JsonObject* obj, const char* member) {
    if (!obj || !json_object_has_member(obj, member)) {
        return nullptr;
    }
    JsonNode* node = json_object_get_member(obj, member);
    if (!node || !JSON_NODE_HOLDS_VALUE(node)) {
        return nullptr;
    }
    return node;
}

JsonObject* object_member(JsonObject* obj, const char* member) {
    if (!obj || !json_object_has_member(obj, member)) {
        return nullptr;
    }
    JsonNode* node = json_object_get_member(obj, member);
    if (!node || !JSON_NODE_HOLDS_OBJECT(node)) {
        return nullptr;
    }
    return json_node_get_object(node);
}

JsonArray* array_member(JsonObject* obj, const char* member) {
    if (!obj || !json_object_has_member(obj, member)) {
        return nullptr;
    }
    JsonNode* node = json_object_get_member(obj, member);
    if (!node || !JSON_NODE_HOLDS_ARRAY(node)) {
        return nullptr;
    }
    return json_node_get_array(node);
}

std::optional<double> node_to_double(JsonNode* node) {
    if (!node || !JSON_NODE_HOLDS_VALUE(node)) {
        return std::nullopt;
    }
    GType type = json_node_get_value_type(node);
    if (type == G_TYPE_DOUBLE) {
        return json_node_get_double(node);
    }
    if (type == G_TYPE_INT64) {
        return static_cast<double>(json_node_get_int(node));
    }
    return std::nullopt;
}

std::optional<std::string> optional_string_member(JsonObject* obj, const char* member) {
    JsonNode* node = value_member(obj, member);
    if (!node || json_node_get_value_type(node) != G_TYPE_STRING) {
        return std::nullopt;
    }
    return std::string(json_node_get_string(node));
}

std::string string_member(JsonObject* obj, const char* member) {
    return optional_string_member(obj, member).value_or("");
}

std::optional<double> number_member(JsonObject* obj, const char* member) {
    return node_to_double(value_member(obj, member));
}

// Clamps in the double domain so out-of-range input never reaches the cast.
int clamp_to_int(double value, int lo = INT_MIN, int hi = INT_MAX) {
    if (std::isnan(value)) {
        return std::clamp(0, lo, hi);
    }
    return static_cast<int>(std::clamp(value, static_cast<double>(lo), static_cast<double>(hi)));
}

int int_member(JsonObject* obj, const char* member, int fallback, int lo = INT_MIN, int hi = INT_MAX) {
    auto value = number_member(obj, member);
    return value ? clamp_to_int(*value, lo, hi) : std::clamp(fallback, lo, hi);
}

bool bool_member(JsonObject* obj, const char* member, bool fallback) {
    JsonNode* node = value_member(obj, member);
    if (!node || json_node_get_value_type(node) != G_TYPE_BOOLEAN) {
        return fallback;
    }
    return json_node_get_boolean(node);
}

std::optional<ScopeRef> parse_scope_ref(JsonObject* obj) {
    if (!obj) {
        return std::nullopt;
    }
    auto port = optional_string_member(obj, "port");
    if (!port) {
        return std::nullopt;
    }
    ScopeRef scope;
    scope.port = *port;
    scope.output_id = optional_string_member(obj, "output_id");
    scope.segment_id = optional_string_member(obj, "segment_id");
    return scope;
}

std::optional<EffectParams> parse_params(JsonObject* obj) {
    if (!obj) {
        return std::nullopt;
    }
    EffectParams params;
    GList* members = json_object_get_members(obj);
    for (GList* it = members; it != nullptr; it = it->next) {
        const char* name = static_cast<const char*>(it->data);
        JsonNode* node = value_member(obj, name);
        if (!node) {
            continue;
        }
        GType type = json_node_get_value_type(node);
        if (type == G_TYPE_BOOLEAN) {
            params[name] = static_cast<bool>(json_node_get_boolean(node));
        } else if (type == G_TYPE_STRING) {
            params[name] = std::string(json_node_get_string(node));
        } else if (auto number = node_to_double(node)) {
            params[name] = *number;
        }
    }
    g_list_free(members);
    return params;
}

ScopeModeState parse_mode(JsonObject* obj) {
    ScopeModeState mode;
    if (!obj) {
        return mode;
    }
    mode.selected_effect_id = optional_string_member(obj, "selected_effect_id");
    mode.effective_effect_id = optional_string_member(obj, "effective_effect_id");
    mode.effective_params = parse_params(object_member(obj, "effective_params"));
    mode.effective_from = parse_scope_ref(object_member(obj, "effective_from"));
    return mode;
}

// Accepts either a bare number or a full state object.
ScopeBrightnessState parse_brightness(JsonObject* parent) {
    ScopeBrightnessState brightness;
    if (auto bare = number_member(parent, "brightness")) {
        brightness.value = clamp_to_int(*bare, 0, 100);
        brightness.effective_value = brightness.value;
        return brightness;
    }

    JsonObject* obj = object_member(parent, "brightness");
    if (!obj) {
        return brightness;
    }
    brightness.value = int_member(obj, "value", 100, 0, 100);
    brightness.effective_value = int_member(obj, "effective_value", brightness.value, 0, 100);
    brightness.effective_from = parse_scope_ref(object_member(obj, "effective_from"));
    brightness.is_following = bool_member(obj, "is_following", false);
    return brightness;
}

std::optional<MatrixMap> parse_matrix(JsonObject* obj) {
    if (!obj) {
        return std::nullopt;
    }
    MatrixMap matrix;
    matrix.width = int_member(obj, "width", 0, 0, kMaxMatrixSide);
    matrix.height = int_member(obj, "height", 0, 0, kMaxMatrixSide);
    if (JsonArray* cells = array_member(obj, "map")) {
        guint length = json_array_get_length(cells);
        matrix.map.reserve(length);
        for (guint i = 0; i < length; ++i) {
            auto index = node_to_double(json_array_get_element(cells, i));
            if (index && *index >= 0.0) {
                matrix.map.push_back(clamp_to_int(*index, 0, kMaxLedCount));
            } else {
                matrix.map.push_back(std::nullopt);
            }
        }
    }
    return matrix;
}

OutputCapabilities parse_capabilities(JsonObject* obj) {
    OutputCapabilities caps;
    if (!obj) {
        return caps;
    }
    caps.editable = bool_member(obj, "editable", false);
    caps.min_total_leds = int_member(obj, "min_total_leds", 0, 0, kMaxLedCount);
    caps.max_total_leds = int_member(obj, "max_total_leds", 0, 0, kMaxLedCount);
    if (JsonArray* allowed = array_member(obj, "allowed_total_leds")) {
        for (guint i = 0; i < json_array_get_length(allowed); ++i) {
            if (auto n = node_to_double(json_array_get_element(allowed, i))) {
                caps.allowed_total_leds.push_back(clamp_to_int(*n, 0, kMaxLedCount));
            }
        }
    }
    if (JsonArray* types = array_member(obj, "allowed_segment_types")) {
        for (guint i = 0; i < json_array_get_length(types); ++i) {
            JsonNode* node = json_array_get_element(types, i);
            if (node && JSON_NODE_HOLDS_VALUE(node) && json_node_get_value_type(node) == G_TYPE_STRING) {
                caps.allowed_segment_types.push_back(
                    lightdesk::segment_type_from_string(json_node_get_string(node)));
            }
        }
    }
    return caps;
}

Segment parse_segment(JsonObject* obj) {
    Segment segment;
    segment.id = string_member(obj, "id");
    segment.name = string_member(obj, "name");
    segment.segment_type = lightdesk::segment_type_from_string(string_member(obj, "segment_type"));
    segment.leds_count = int_member(obj, "leds_count", 0, 0, kMaxLedCount);
    segment.matrix = parse_matrix(object_member(obj, "matrix"));
    segment.mode = parse_mode(object_member(obj, "mode"));
    segment.brightness = parse_brightness(obj);
    return segment;
}

OutputPort parse_output(JsonObject* obj) {
    OutputPort output;
    output.id = string_member(obj, "id");
    output.name = string_member(obj, "name");
    output.output_type = lightdesk::segment_type_from_string(string_member(obj, "output_type"));
    output.leds_count = int_member(obj, "leds_count", 0, 0, kMaxLedCount);
    output.matrix = parse_matrix(object_member(obj, "matrix"));
    output.capabilities = parse_capabilities(object_member(obj, "capabilities"));
    output.mode = parse_mode(object_member(obj, "mode"));
    output.brightness = parse_brightness(obj);
    if (JsonArray* segments = array_member(obj, "segments")) {
        for (guint i = 0; i < json_array_get_length(segments); ++i) {
            JsonNode* node = json_array_get_element(segments, i);
            if (node && JSON_NODE_HOLDS_OBJECT(node)) {
                output.segments.push_back(parse_segment(json_node_get_object(node)));
            }
        }
    }
    return output;
}

std::optional<Device> parse_device(JsonObject* obj) {
    auto port = optional_string_member(obj, "port");
    if (!port) {
        return std::nullopt;
    }
    Device device;
    device.port = *port;
    device.model = string_member(obj, "model");
    device.description = string_member(obj, "description");
    device.id = string_member(obj, "id");
    device.device_type = lightdesk::device_type_from_string(string_member(obj, "device_type"));
    device.mode = parse_mode(object_member(obj, "mode"));
    device.brightness = parse_brightness(obj);
    device.brightness.is_following = false;
    if (JsonArray* outputs = array_member(obj, "outputs")) {
        for (guint i = 0; i < json_array_get_length(outputs); ++i) {
            JsonNode* node = json_array_get_element(outputs, i);
            if (node && JSON_NODE_HOLDS_OBJECT(node)) {
                device.outputs.push_back(parse_output(json_node_get_object(node)));
            }
        }
    }
    return device;
}

std::optional<ParamDependency> parse_dependency(JsonObject* obj) {
    if (!obj) {
        return std::nullopt;
    }
    ParamDependency dependency;
    dependency.key = optional_string_member(obj, "key");
    dependency.equals = number_member(obj, "equals");
    dependency.not_equals = number_member(obj, "not_equals");
    if (!dependency.not_equals) {
        dependency.not_equals = number_member(obj, "notEquals");
    }
    dependency.behavior = string_member(obj, "behavior") == "hide" ? ParamDependencyBehavior::Hide
                                                                   : ParamDependencyBehavior::Disable;
    return dependency;
}

// Entries with an unknown type or no key are skipped.
std::optional<EffectParam> parse_effect_param(JsonObject* obj) {
    EffectParam param;
    if (!core::param_kind_from_string(string_member(obj, "type"), param.kind)) {
        return std::nullopt;
    }
    param.key = string_member(obj, "key");
    if (param.key.empty()) {
        return std::nullopt;
    }
    param.label = string_member(obj, "label");
    if (param.label.empty()) {
        param.label = param.key;
    }

    if (param.kind == EffectParamKind::Toggle) {
        param.default_value = bool_member(obj, "default", false) ? 1.0 : 0.0;
    } else {
        param.default_value = number_member(obj, "default").value_or(0.0);
    }

    if (param.kind == EffectParamKind::Slider) {
        param.min = number_member(obj, "min").value_or(0.0);
        param.max = number_member(obj, "max").value_or(std::max(param.min, 1.0));
        param.step = number_member(obj, "step").value_or(1.0);
        if (param.step <= 0.0) {
            param.step = 1.0;
        }
    }

    if (JsonArray* options = array_member(obj, "options")) {
        for (guint i = 0; i < json_array_get_length(options); ++i) {
            JsonNode* node = json_array_get_element(options, i);
            if (!node || !JSON_NODE_HOLDS_OBJECT(node)) {
                continue;
            }
            JsonObject* option = json_node_get_object(node);
            auto value = number_member(option, "value");
            if (!value) {
                continue;
            }
            SelectOption entry;
            entry.value = *value;
            entry.label = string_member(option, "label");
            param.options.push_back(std::move(entry));
        }
    }
    param.dependency = parse_dependency(object_member(obj, "dependency"));
    return param;
}

std::uint8_t color_channel(JsonObject* obj, const char* member) {
    auto value = number_member(obj, member);
    if (!value) {
        return 0;
    }
    return static_cast<std::uint8_t>(clamp_to_int(*value, 0, 255));
}

bool with_json_root(const std::string& text, const std::function<bool(JsonNode*)>& fn, std::string& error) {
    GError* gerror = nullptr;
    JsonParser* parser = json_parser_new();
    if (!json_parser_load_from_data(parser, text.c_str(), static_cast<gssize>(text.size()), &gerror)) {
        error = gerror ? gerror->message : "invalid JSON";
        if (gerror) {
            g_error_free(gerror);
        }
        g_object_unref(parser);
        return false;
    }

    JsonNode* root = json_parser_get_root(parser);
    bool ok = root != nullptr && fn(root);
    g_object_unref(parser);
    return ok;
}

// Unwraps {"ok":..,"result":..|"error":..} and hands the result node on.
bool with_result(const std::string& line, const std::function<bool(JsonNode*, std::string&)>& fn,
                 std::string& error) {
    return with_json_root(
        line,
        [&](JsonNode* root) {
            if (!JSON_NODE_HOLDS_OBJECT(root)) {
                error = "malformed response";
                return false;
            }
            JsonObject* obj = json_node_get_object(root);
            if (!bool_member(obj, "ok", false)) {
                error = string_member(obj, "error");
                if (error.empty()) {
                    error = "request failed";
                }
                return false;
            }
            JsonNode* result = json_object_has_member(obj, "result") ? json_object_get_member(obj, "result")
                                                                     : nullptr;
            return fn(result, error);
        },
        error);
}

// --- encoding helpers -------------------------------------------------------

void add_scope_members(JsonBuilder* builder, const ScopeRef& scope) {
    json_builder_set_member_name(builder, "port");
    json_builder_add_string_value(builder, scope.port.c_str());
    if (scope.output_id) {
        json_builder_set_member_name(builder, "output_id");
        json_builder_add_string_value(builder, scope.output_id->c_str());
    }
    if (scope.segment_id) {
        json_builder_set_member_name(builder, "segment_id");
        json_builder_add_string_value(builder, scope.segment_id->c_str());
    }
}

std::string build_command(const std::string& command, const std::function<void(JsonBuilder*)>& add_args) {
    JsonBuilder* builder = json_builder_new();
    json_builder_begin_object(builder);
    json_builder_set_member_name(builder, "cmd");
    json_builder_add_string_value(builder, command.c_str());
    json_builder_set_member_name(builder, "args");
    json_builder_begin_object(builder);
    if (add_args) {
        add_args(builder);
    }
    json_builder_end_object(builder);
    json_builder_end_object(builder);

    JsonNode* root = json_builder_get_root(builder);
    JsonGenerator* generator = json_generator_new();
    json_generator_set_root(generator, root);
    gchar* text = json_generator_to_data(generator, nullptr);
    std::string out = text ? text : "";

    g_free(text);
    json_node_free(root);
    g_object_unref(generator);
    g_object_unref(builder);
    return out;
}

// --- socket helpers ---------------------------------------------------------

int connect_unix(const std::string& path, std::string& error) {
    sockaddr_un addr{};
    if (path.empty() || path.size() >= sizeof(addr.sun_path)) {
        error = "invalid socket path: " + path;
        return -1;
    }
    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);

    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        error = std::string("socket: ") + std::strerror(errno);
        return -1;
    }
    if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        error = "cannot connect to " + path + ": " + std::strerror(errno);
        close(fd);
        return -1;
    }
    return fd;
}

void set_receive_timeout(int fd, int seconds) {
    timeval tv{};
    tv.tv_sec = seconds;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}

bool write_all(int fd, const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = send(fd, data.data() + written, data.size() - written, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

class LineReader {
public:
    explicit LineReader(int fd) : m_fd(fd) {}

    bool read_line(std::string& line) {
        for (;;) {
            size_t pos = m_buffer.find('\n');
            if (pos != std::string::npos) {
                line = m_buffer.substr(0, pos);
                m_buffer.erase(0, pos + 1);
                return true;
            }

            char chunk[4096];
            ssize_t n = recv(m_fd, chunk, sizeof(chunk), 0);
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                return false;
            }
            m_buffer.append(chunk, static_cast<size_t>(n));
        }
    }

private:
    int m_fd;
    std::string m_buffer;
};

void read_events(LineReader& reader, const core::LedFrameSource::FrameHandler& handler) {
    std::string line;
    while (reader.read_line(line)) {
        if (line.empty()) {
            continue;
        }
        if (auto frame = lightdesk::parse_led_update(line)) {
            handler(*frame);
        }
    }
}
}  // namespace

std::string lightdesk::default_socket_path() {
    if (const char* env = std::getenv("LIGHTDESK_SOCKET")) {
        if (*env != '\0') {
            return env;
        }
    }
    if (const char* runtime = std::getenv("XDG_RUNTIME_DIR")) {
        if (*runtime != '\0') {
            return std::string(runtime) + "/lightdesk.sock";
        }
    }
    return "/tmp/lightdesk.sock";
}

const char* lightdesk::segment_type_to_string(SegmentType type) {
    switch (type) {
        case SegmentType::Single: return "Single";
        case SegmentType::Linear: return "Linear";
        case SegmentType::Matrix: return "Matrix";
    }
    return "Linear";
}

SegmentType lightdesk::segment_type_from_string(const std::string& text) {
    if (text == "Single") {
        return SegmentType::Single;
    }
    if (text == "Matrix") {
        return SegmentType::Matrix;
    }
    return SegmentType::Linear;
}

const char* lightdesk::device_type_to_string(DeviceType type) {
    for (const auto& entry : kDeviceTypeNames) {
        if (entry.type == type) {
            return entry.name;
        }
    }
    return "Unknown";
}

DeviceType lightdesk::device_type_from_string(const std::string& text) {
    for (const auto& entry : kDeviceTypeNames) {
        if (text == entry.name) {
            return entry.type;
        }
    }
    return DeviceType::Unknown;
}

std::string lightdesk::build_request(const std::string& command) {
    return build_command(command, nullptr);
}

std::string lightdesk::build_listen_request() {
    return build_command("listen", [](JsonBuilder* builder) {
        json_builder_set_member_name(builder, "event");
        json_builder_add_string_value(builder, kLedUpdateEvent);
    });
}

std::string lightdesk::build_scope_effect_request(const ScopeRef& scope,
                                                  const std::optional<std::string>& effect_id) {
    return build_command("set_scope_effect", [&](JsonBuilder* builder) {
        add_scope_members(builder, scope);
        json_builder_set_member_name(builder, "effect_id");
        if (effect_id) {
            json_builder_add_string_value(builder, effect_id->c_str());
        } else {
            json_builder_add_null_value(builder);
        }
    });
}

std::string lightdesk::build_scope_brightness_request(const ScopeRef& scope, int brightness) {
    return build_command("set_scope_brightness", [&](JsonBuilder* builder) {
        add_scope_members(builder, scope);
        json_builder_set_member_name(builder, "brightness");
        json_builder_add_int_value(builder, std::clamp(brightness, 0, 100));
    });
}

std::string lightdesk::build_scope_params_request(const ScopeRef& scope, const EffectParams& params) {
    return build_command("update_scope_effect_params", [&](JsonBuilder* builder) {
        add_scope_members(builder, scope);
        json_builder_set_member_name(builder, "params");
        json_builder_begin_object(builder);
        for (const auto& param : params) {
            json_builder_set_member_name(builder, param.first.c_str());
            if (const auto* number = std::get_if<double>(&param.second)) {
                json_builder_add_double_value(builder, *number);
            } else if (const auto* flag = std::get_if<bool>(&param.second)) {
                json_builder_add_boolean_value(builder, *flag);
            } else {
                json_builder_add_string_value(builder, std::get<std::string>(param.second).c_str());
            }
        }
        json_builder_end_object(builder);
    });
}

bool lightdesk::parse_ack_response(const std::string& line, std::string& error) {
    return with_result(line, [](JsonNode*, std::string&) { return true; }, error);
}

bool lightdesk::parse_devices_response(const std::string& line, std::vector<Device>& devices,
                                       std::string& error) {
    return with_result(
        line,
        [&devices](JsonNode* result, std::string& err) {
            if (!result || !JSON_NODE_HOLDS_ARRAY(result)) {
                err = "device list missing";
                return false;
            }
            JsonArray* array = json_node_get_array(result);
            devices.clear();
            for (guint i = 0; i < json_array_get_length(array); ++i) {
                JsonNode* node = json_array_get_element(array, i);
                if (!node || !JSON_NODE_HOLDS_OBJECT(node)) {
                    continue;
                }
                if (auto device = parse_device(json_node_get_object(node))) {
                    devices.push_back(std::move(*device));
                }
            }
            return true;
        },
        error);
}

bool lightdesk::parse_effects_response(const std::string& line, std::vector<EffectInfo>& effects,
                                       std::string& error) {
    return with_result(
        line,
        [&effects](JsonNode* result, std::string& err) {
            if (!result || !JSON_NODE_HOLDS_ARRAY(result)) {
                err = "effect list missing";
                return false;
            }
            JsonArray* array = json_node_get_array(result);
            effects.clear();
            for (guint i = 0; i < json_array_get_length(array); ++i) {
                JsonNode* node = json_array_get_element(array, i);
                if (!node || !JSON_NODE_HOLDS_OBJECT(node)) {
                    continue;
                }
                JsonObject* obj = json_node_get_object(node);
                EffectInfo effect;
                effect.id = string_member(obj, "id");
                if (effect.id.empty()) {
                    continue;
                }
                effect.name = string_member(obj, "name");
                if (effect.name.empty()) {
                    effect.name = effect.id;
                }
                effect.description = string_member(obj, "description");
                effect.group = string_member(obj, "group");
                if (JsonArray* params = array_member(obj, "params")) {
                    for (guint p = 0; p < json_array_get_length(params); ++p) {
                        JsonNode* param = json_array_get_element(params, p);
                        if (!param || !JSON_NODE_HOLDS_OBJECT(param)) {
                            continue;
                        }
                        if (auto parsed = parse_effect_param(json_node_get_object(param))) {
                            effect.params.push_back(std::move(*parsed));
                        }
                    }
                }
                effects.push_back(std::move(effect));
            }
            return true;
        },
        error);
}

std::optional<LedFrame> lightdesk::parse_led_update(const std::string& line) {
    std::optional<LedFrame> frame;
    std::string error;
    with_json_root(
        line,
        [&frame](JsonNode* root) {
            if (!JSON_NODE_HOLDS_OBJECT(root)) {
                return false;
            }
            JsonObject* obj = json_node_get_object(root);
            if (string_member(obj, "event") != kLedUpdateEvent) {
                return false;
            }
            JsonObject* payload = object_member(obj, "payload");
            auto port = optional_string_member(payload, "port");
            if (!port) {
                return false;
            }

            LedFrame parsed;
            parsed.port = *port;
            if (JsonArray* colors = array_member(payload, "colors")) {
                guint length = json_array_get_length(colors);
                parsed.colors.reserve(length);
                for (guint i = 0; i < length; ++i) {
                    JsonNode* node = json_array_get_element(colors, i);
                    LedColor color;
                    if (node && JSON_NODE_HOLDS_OBJECT(node)) {
                        JsonObject* c = json_node_get_object(node);
                        color.r = color_channel(c, "r");
                        color.g = color_channel(c, "g");
                        color.b = color_channel(c, "b");
                    }
                    parsed.colors.push_back(color);
                }
            }
            frame = std::move(parsed);
            return true;
        },
        error);
    return frame;
}

LightdeskBackend::LightdeskBackend(std::string socket_path) : m_socket_path(std::move(socket_path)) {}

LightdeskBackend::~LightdeskBackend() {
    stop_listening();
}

const std::string& LightdeskBackend::socket_path() const {
    return m_socket_path;
}

bool LightdeskBackend::request(const std::string& line, std::string& response, std::string& error) const {
    int fd = connect_unix(m_socket_path, error);
    if (fd < 0) {
        return false;
    }
    set_receive_timeout(fd, kRequestTimeoutSeconds);

    bool ok = write_all(fd, line + "\n");
    if (!ok) {
        error = std::string("write failed: ") + std::strerror(errno);
    } else {
        LineReader reader(fd);
        ok = reader.read_line(response);
        if (!ok) {
            error = "no response from daemon";
        }
    }
    close(fd);
    return ok;
}

bool LightdeskBackend::send_command(const std::string& line, std::string& error) const {
    std::string response;
    if (!request(line, response, error)) {
        return false;
    }
    return lightdesk::parse_ack_response(response, error);
}

DeviceSnapshot LightdeskBackend::load_snapshot(const std::string& command) const {
    DeviceSnapshot snapshot;
    std::string response;
    if (!request(lightdesk::build_request(command), response, snapshot.error)) {
        logging::warn("backend.request_failed", {{"cmd", command}, {"error", snapshot.error}});
        return snapshot;
    }
    snapshot.ok = lightdesk::parse_devices_response(response, snapshot.devices, snapshot.error);
    if (!snapshot.ok) {
        logging::warn("backend.bad_response", {{"cmd", command}, {"error", snapshot.error}});
    }
    return snapshot;
}

DeviceSnapshot LightdeskBackend::scan_devices() const {
    return load_snapshot("scan_devices");
}

DeviceSnapshot LightdeskBackend::get_devices() const {
    return load_snapshot("get_devices");
}

bool LightdeskBackend::get_effects(std::vector<EffectInfo>& effects, std::string& error) const {
    std::string response;
    if (!request(lightdesk::build_request("get_effects"), response, error)) {
        return false;
    }
    return lightdesk::parse_effects_response(response, effects, error);
}

bool LightdeskBackend::set_scope_effect(const ScopeRef& scope, const std::optional<std::string>& effect_id,
                                        std::string& error) const {
    return send_command(lightdesk::build_scope_effect_request(scope, effect_id), error);
}

bool LightdeskBackend::set_scope_brightness(const ScopeRef& scope, int brightness, std::string& error) const {
    return send_command(lightdesk::build_scope_brightness_request(scope, brightness), error);
}

bool LightdeskBackend::update_scope_effect_params(const ScopeRef& scope, const EffectParams& params,
                                                  std::string& error) const {
    return send_command(lightdesk::build_scope_params_request(scope, params), error);
}

bool LightdeskBackend::listen_led_updates(FrameHandler handler, std::string& error) {
    // A reader that ended on its own still has to be joined.
    std::thread finished;
    {
        std::lock_guard<std::mutex> lock(m_listen_mutex);
        if (m_listen_fd >= 0) {
            return true;
        }
        finished = std::move(m_listen_thread);
    }
    if (finished.joinable()) {
        finished.join();
    }

    std::lock_guard<std::mutex> lock(m_listen_mutex);
    if (m_listen_fd >= 0) {
        return true;
    }

    int fd = connect_unix(m_socket_path, error);
    if (fd < 0) {
        return false;
    }
    set_receive_timeout(fd, kRequestTimeoutSeconds);

    if (!write_all(fd, lightdesk::build_listen_request() + "\n")) {
        error = std::string("write failed: ") + std::strerror(errno);
        close(fd);
        return false;
    }

    LineReader reader(fd);
    std::string ack;
    if (!reader.read_line(ack)) {
        error = "no acknowledgement from daemon";
        close(fd);
        return false;
    }
    if (!lightdesk::parse_ack_response(ack, error)) {
        close(fd);
        return false;
    }

    set_receive_timeout(fd, 0);
    m_listen_fd = fd;
    m_listen_thread = std::thread([this, fd, reader = std::move(reader), handler = std::move(handler)]() mutable {
        read_events(reader, handler);
        on_stream_closed(fd);
    });
    return true;
}

// Runs on the reader thread. After stop_listening() the descriptor belongs to
// the caller that is joining us.
void LightdeskBackend::on_stream_closed(int fd) {
    std::lock_guard<std::mutex> lock(m_listen_mutex);
    if (m_listen_fd != fd) {
        logging::info("backend.stream_closed");
        return;
    }
    m_listen_fd = -1;
    close(fd);
    logging::warn("backend.stream_lost", {{"socket", m_socket_path}});
}

bool LightdeskBackend::is_listening() const {
    std::lock_guard<std::mutex> lock(m_listen_mutex);
    return m_listen_fd >= 0;
}

void LightdeskBackend::stop_listening() {
    std::thread reader;
    int fd = -1;
    {
        std::lock_guard<std::mutex> lock(m_listen_mutex);
        fd = m_listen_fd;
        m_listen_fd = -1;
        reader = std::move(m_listen_thread);
        if (fd >= 0) {
            shutdown(fd, SHUT_RDWR);
        }
    }
    if (reader.joinable()) {
        reader.join();
    }
    if (fd >= 0) {
        close(fd);
    }
}
