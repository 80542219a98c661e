#ifndef CORE_COLOR_STREAM_HPP
#define CORE_COLOR_STREAM_HPP

#include "core/models.hpp"

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace core {
// The backend's push channel for per-port color frames.
class LedFrameSource {
public:
    using FrameHandler = std::function<void(const LedFrame&)>;

    virtual ~LedFrameSource() = default;

    // Blocks until the channel is established. Frames are then delivered to
    // the handler from the source's own thread until stop_listening().
    virtual bool listen_led_updates(FrameHandler handler, std::string& error) = 0;
    virtual void stop_listening() = 0;
    // False once stopped or once the peer has closed the channel.
    virtual bool is_listening() const = 0;
};

// Fans inbound frames out to per-port subscribers and caches the latest frame
// of every port. Owned by the caller; shutdown() (or destruction) detaches it
// from the source and drops every subscriber.
class ColorStreamDistributor {
public:
    using Subscriber = std::function<void(const std::vector<LedColor>&)>;
    using Unsubscribe = std::function<void()>;

    explicit ColorStreamDistributor(LedFrameSource& source);
    ~ColorStreamDistributor();

    ColorStreamDistributor(const ColorStreamDistributor&) = delete;
    ColorStreamDistributor& operator=(const ColorStreamDistributor&) = delete;

    // Single-flight: concurrent callers share one in-flight attempt. A failed
    // attempt, or a channel the source has since lost, is logged and a later
    // call starts a new one.
    std::shared_future<bool> ensure_listening();
    bool is_listening() const;

    // The returned disposer is idempotent and may outlive the distributor.
    // Once it returns, the callback is not invoked again.
    Unsubscribe subscribe(const std::string& port, Subscriber callback);
    std::optional<std::vector<LedColor>> get_latest(const std::string& port) const;
    std::size_t subscriber_count(const std::string& port) const;

    void publish(const LedFrame& frame);
    void shutdown();

private:
    struct Registry;

    LedFrameSource& m_source;
    std::shared_ptr<Registry> m_registry;

    mutable std::mutex m_setup_mutex;
    bool m_listening = false;
    bool m_shut_down = false;
    std::shared_future<bool> m_pending;
    std::thread m_setup_thread;
};
}  // namespace core

#endif
