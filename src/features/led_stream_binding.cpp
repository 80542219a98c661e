#include "features/led_stream_binding.hpp"

#include "core/logging.hpp"

#include <algorithm>
#include <utility>

namespace {
constexpr unsigned int kListenPollMs = 100;
}

namespace features {
LedStreamBinding::LedStreamBinding(core::ColorStreamDistributor& distributor, std::chrono::milliseconds interval,
                                   FrameCallback on_frame)
    : m_distributor(distributor), m_throttle(interval), m_on_frame(std::move(on_frame)) {
    m_dispatcher.connect(sigc::mem_fun(*this, &LedStreamBinding::on_incoming));
}

LedStreamBinding::~LedStreamBinding() {
    unbind();
    m_listen_poll.disconnect();
}

void LedStreamBinding::set_listen_callback(ListenCallback callback) {
    m_on_listen = std::move(callback);
}

void LedStreamBinding::bind(const std::string& port) {
    if (port == m_port && m_unsubscribe) {
        return;
    }
    unbind();
    if (port.empty()) {
        return;
    }

    m_port = port;
    // Runs on the backend's reader thread.
    m_unsubscribe = m_distributor.subscribe(port, [this](const std::vector<LedColor>& colors) {
        m_throttle.offer(colors);
        m_dispatcher.emit();
    });

    if (auto latest = m_distributor.get_latest(port)) {
        m_on_frame(*latest);
    }

    if (!m_listen_poll.connected()) {
        m_listening = m_distributor.ensure_listening();
        m_listen_poll = Glib::signal_timeout().connect(sigc::mem_fun(*this, &LedStreamBinding::poll_listening),
                                                       kListenPollMs);
    }
}

void LedStreamBinding::unbind() {
    if (m_unsubscribe) {
        m_unsubscribe();
        m_unsubscribe = nullptr;
    }
    m_throttle.cancel();
    m_flush_timer.disconnect();
    m_port.clear();
}

const std::string& LedStreamBinding::port() const {
    return m_port;
}

void LedStreamBinding::on_incoming() {
    if (m_flush_timer.connected()) {
        return;
    }

    const auto now = core::LatestThrottle<std::vector<LedColor>>::Clock::now();
    auto wait = m_throttle.time_until_ready(now);
    if (!wait) {
        return;
    }
    if (wait->count() == 0) {
        flush();
        return;
    }
    m_flush_timer = Glib::signal_timeout().connect(
        [this]() {
            flush();
            return false;
        },
        static_cast<unsigned int>(std::max<long long>(1, wait->count())));
}

void LedStreamBinding::flush() {
    auto colors = m_throttle.take(core::LatestThrottle<std::vector<LedColor>>::Clock::now());
    if (colors && !m_port.empty()) {
        m_on_frame(*colors);
    }
}

bool LedStreamBinding::poll_listening() {
    if (!m_listening.valid()) {
        return false;
    }
    if (m_listening.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        return true;
    }

    const bool ok = m_listening.get();
    m_listening = std::shared_future<bool>();
    if (!ok) {
        logging::warn("stream.unavailable", {{"port", m_port}});
    }
    if (m_on_listen) {
        m_on_listen(ok);
    }
    return false;
}
}  // namespace features
