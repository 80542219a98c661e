#ifndef FEATURES_LED_STREAM_BINDING_HPP
#define FEATURES_LED_STREAM_BINDING_HPP

#include "core/color_stream.hpp"
#include "core/latest_throttle.hpp"
#include "core/models.hpp"

#include <glibmm/dispatcher.h>
#include <glibmm/main.h>

#include <chrono>
#include <functional>
#include <future>
#include <string>
#include <vector>

namespace features {
// Follows one port of the color stream and hands its frames to the UI thread,
// at most one per interval with the newest frame winning.
class LedStreamBinding {
public:
    using FrameCallback = std::function<void(const std::vector<LedColor>&)>;
    using ListenCallback = std::function<void(bool)>;

    LedStreamBinding(core::ColorStreamDistributor& distributor, std::chrono::milliseconds interval,
                     FrameCallback on_frame);
    ~LedStreamBinding();

    LedStreamBinding(const LedStreamBinding&) = delete;
    LedStreamBinding& operator=(const LedStreamBinding&) = delete;

    void set_listen_callback(ListenCallback callback);

    // Replaces the current port. A cached frame for the new port is delivered
    // right away.
    void bind(const std::string& port);
    void unbind();
    const std::string& port() const;

private:
    void on_incoming();
    void flush();
    bool poll_listening();

    core::ColorStreamDistributor& m_distributor;
    core::LatestThrottle<std::vector<LedColor>> m_throttle;
    FrameCallback m_on_frame;
    ListenCallback m_on_listen;

    std::string m_port;
    core::ColorStreamDistributor::Unsubscribe m_unsubscribe;
    Glib::Dispatcher m_dispatcher;
    sigc::connection m_flush_timer;
    sigc::connection m_listen_poll;
    std::shared_future<bool> m_listening;
};
}  // namespace features

#endif
