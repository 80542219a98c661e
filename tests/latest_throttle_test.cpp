#include "core/latest_throttle.hpp"

#include <cassert>
#include <chrono>

using namespace std::chrono_literals;

int main() {
    using Throttle = core::LatestThrottle<int>;
    const Throttle::Clock::time_point t0{};

    {
        Throttle throttle(50ms);
        assert(!throttle.take(t0));
        assert(!throttle.time_until_ready(t0));

        // The first value goes out immediately.
        assert(throttle.offer(10));
        assert(throttle.time_until_ready(t0) == 0ms);
        assert(throttle.take(t0) == 10);

        // Later offers within the interval collapse to the newest one.
        throttle.offer(20);
        throttle.offer(30);
        throttle.offer(40);
        assert(!throttle.take(t0 + 10ms));
        assert(throttle.time_until_ready(t0 + 10ms) == 40ms);
        assert(throttle.take(t0 + 50ms) == 40);
        assert(!throttle.has_pending());
        assert(!throttle.take(t0 + 200ms));
    }

    {
        Throttle throttle(50ms);
        throttle.offer(1);
        assert(throttle.take(t0) == 1);

        // Forced values skip the wait.
        throttle.offer(2, true);
        assert(throttle.take(t0 + 1ms) == 2);

        throttle.offer(3);
        throttle.cancel();
        assert(!throttle.has_pending());
        assert(!throttle.take(t0 + 500ms));
    }

    {
        Throttle throttle(50ms, [](const int& a, const int& b) { return a == b; });
        assert(throttle.offer(5));
        assert(throttle.take(t0) == 5);

        assert(!throttle.offer(5));
        assert(!throttle.has_pending());
        assert(throttle.offer(5, true));
        assert(throttle.offer(6));
        assert(throttle.take(t0 + 1ms) == 6);

        // Going back to the value already sent cancels the newer pending one.
        assert(throttle.offer(7));
        assert(!throttle.offer(6));
        assert(!throttle.has_pending());
        assert(!throttle.take(t0 + 100ms));
    }

    {
        Throttle throttle(-5ms);
        assert(throttle.interval() == 0ms);
        throttle.offer(1);
        assert(throttle.take(t0) == 1);
        throttle.offer(2);
        assert(throttle.take(t0) == 2);
    }

    return 0;
}
