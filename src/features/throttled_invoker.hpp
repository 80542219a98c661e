#ifndef FEATURES_THROTTLED_INVOKER_HPP
#define FEATURES_THROTTLED_INVOKER_HPP

#include "core/latest_throttle.hpp"

#include <glibmm/main.h>

#include <algorithm>
#include <chrono>
#include <functional>
#include <utility>

namespace features {
// Calls invoke with the newest requested value at most once per interval.
// Lives on the Glib main loop; pending values are flushed by a timeout.
template <typename T>
class LatestThrottledInvoker {
public:
    using Invoke = std::function<void(const T&)>;
    using EqualFn = typename core::LatestThrottle<T>::EqualFn;

    LatestThrottledInvoker(std::chrono::milliseconds interval, Invoke invoke, EqualFn are_equal = EqualFn())
        : m_throttle(interval, std::move(are_equal)), m_invoke(std::move(invoke)) {}

    ~LatestThrottledInvoker() {
        disarm();
    }

    LatestThrottledInvoker(const LatestThrottledInvoker&) = delete;
    LatestThrottledInvoker& operator=(const LatestThrottledInvoker&) = delete;

    void request(T value, bool force = false) {
        if (!m_throttle.offer(std::move(value), force)) {
            return;
        }
        pump();
    }

    void cancel() {
        m_throttle.cancel();
        disarm();
    }

private:
    void pump() {
        const auto now = core::LatestThrottle<T>::Clock::now();
        if (auto value = m_throttle.take(now)) {
            m_invoke(*value);
            return;
        }

        auto wait = m_throttle.time_until_ready(now);
        if (!wait || m_armed) {
            return;
        }
        m_armed = true;
        m_timer = Glib::signal_timeout().connect(
            [this]() {
                m_armed = false;
                pump();
                return false;
            },
            static_cast<unsigned int>(std::max<long long>(1, wait->count())));
    }

    void disarm() {
        if (m_armed) {
            m_timer.disconnect();
            m_armed = false;
        }
    }

    core::LatestThrottle<T> m_throttle;
    Invoke m_invoke;
    sigc::connection m_timer;
    bool m_armed = false;
};
}  // namespace features

#endif
