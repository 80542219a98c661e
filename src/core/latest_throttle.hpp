#ifndef CORE_LATEST_THROTTLE_HPP
#define CORE_LATEST_THROTTLE_HPP

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <utility>

namespace core {
// Latest-wins rate limiter. Offers overwrite the pending value; take() hands
// it out at most once per interval. Callers drive it with their own clock.
template <typename T>
class LatestThrottle {
public:
    using Clock = std::chrono::steady_clock;
    using EqualFn = std::function<bool(const T&, const T&)>;

    explicit LatestThrottle(std::chrono::milliseconds interval, EqualFn are_equal = EqualFn())
        : m_interval(interval.count() < 0 ? std::chrono::milliseconds(0) : interval),
          m_are_equal(std::move(are_equal)) {}

    // Returns false when the value matches the last one taken. The value is
    // dropped along with any older pending one, which it supersedes.
    bool offer(T value, bool force = false) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!force && m_are_equal && m_last_taken && m_are_equal(value, *m_last_taken)) {
            m_pending.reset();
            m_force = false;
            return false;
        }
        m_pending = std::move(value);
        m_force = m_force || force;
        return true;
    }

    std::optional<T> take(Clock::time_point now) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_pending || !ready_locked(now)) {
            return std::nullopt;
        }

        std::optional<T> value = std::move(m_pending);
        m_pending.reset();
        m_force = false;
        m_last_flush = now;
        if (m_are_equal) {
            m_last_taken = value;
        }
        return value;
    }

    // Zero when take() would succeed now; empty when nothing is pending.
    std::optional<std::chrono::milliseconds> time_until_ready(Clock::time_point now) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_pending) {
            return std::nullopt;
        }
        if (ready_locked(now)) {
            return std::chrono::milliseconds(0);
        }
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - *m_last_flush);
        return m_interval - elapsed;
    }

    bool has_pending() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_pending.has_value();
    }

    void cancel() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pending.reset();
        m_force = false;
    }

    std::chrono::milliseconds interval() const { return m_interval; }

private:
    bool ready_locked(Clock::time_point now) const {
        return m_force || !m_last_flush || now - *m_last_flush >= m_interval;
    }

    mutable std::mutex m_mutex;
    std::chrono::milliseconds m_interval;
    EqualFn m_are_equal;
    std::optional<T> m_pending;
    std::optional<T> m_last_taken;
    std::optional<Clock::time_point> m_last_flush;
    bool m_force = false;
};
}  // namespace core

#endif
