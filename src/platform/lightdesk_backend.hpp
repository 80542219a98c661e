#ifndef LIGHTDESK_BACKEND_HPP
#define LIGHTDESK_BACKEND_HPP

#include "core/color_stream.hpp"
#include "core/models.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace lightdesk {
constexpr const char* kLedUpdateEvent = "device-led-update";

std::string default_socket_path();

const char* segment_type_to_string(SegmentType type);
SegmentType segment_type_from_string(const std::string& text);
const char* device_type_to_string(DeviceType type);
DeviceType device_type_from_string(const std::string& text);

std::string build_request(const std::string& command);
std::string build_listen_request();
std::string build_scope_effect_request(const ScopeRef& scope, const std::optional<std::string>& effect_id);
std::string build_scope_brightness_request(const ScopeRef& scope, int brightness);
std::string build_scope_params_request(const ScopeRef& scope, const EffectParams& params);

bool parse_ack_response(const std::string& line, std::string& error);
bool parse_devices_response(const std::string& line, std::vector<Device>& devices, std::string& error);
bool parse_effects_response(const std::string& line, std::vector<EffectInfo>& effects, std::string& error);
std::optional<LedFrame> parse_led_update(const std::string& line);
}  // namespace lightdesk

// Client for the lighting daemon: one JSON request per connection for
// commands, plus one long-lived connection carrying LED frames.
class LightdeskBackend : public core::LedFrameSource {
public:
    explicit LightdeskBackend(std::string socket_path = lightdesk::default_socket_path());
    ~LightdeskBackend() override;

    LightdeskBackend(const LightdeskBackend&) = delete;
    LightdeskBackend& operator=(const LightdeskBackend&) = delete;

    DeviceSnapshot scan_devices() const;
    DeviceSnapshot get_devices() const;
    bool get_effects(std::vector<EffectInfo>& effects, std::string& error) const;

    bool set_scope_effect(const ScopeRef& scope, const std::optional<std::string>& effect_id,
                          std::string& error) const;
    bool set_scope_brightness(const ScopeRef& scope, int brightness, std::string& error) const;
    bool update_scope_effect_params(const ScopeRef& scope, const EffectParams& params, std::string& error) const;

    bool listen_led_updates(FrameHandler handler, std::string& error) override;
    void stop_listening() override;
    bool is_listening() const override;

    const std::string& socket_path() const;

private:
    bool request(const std::string& line, std::string& response, std::string& error) const;
    bool send_command(const std::string& line, std::string& error) const;
    DeviceSnapshot load_snapshot(const std::string& command) const;
    void on_stream_closed(int fd);

    std::string m_socket_path;
    mutable std::mutex m_listen_mutex;
    int m_listen_fd = -1;
    std::thread m_listen_thread;
};

#endif
