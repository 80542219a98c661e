#include "core/color_stream.hpp"
#include "core/logging.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
class FakeFrameSource : public core::LedFrameSource {
public:
    bool listen_led_updates(FrameHandler handler, std::string& error) override {
        std::unique_lock<std::mutex> lock(m_mutex);
        ++m_calls;
        m_cv.wait(lock, [this]() { return m_released; });
        if (m_fail_next) {
            m_fail_next = false;
            error = "connection refused";
            return false;
        }
        m_handler = std::move(handler);
        return true;
    }

    void stop_listening() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_handler = nullptr;
        ++m_stops;
    }

    bool is_listening() const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return static_cast<bool>(m_handler);
    }

    // The peer hung up.
    void drop() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_handler = nullptr;
    }

    void release() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_released = true;
        m_cv.notify_all();
    }

    void fail_next() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_fail_next = true;
    }

    // Delivers a frame the way the socket reader thread would.
    bool emit(const LedFrame& frame) {
        FrameHandler handler;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            handler = m_handler;
        }
        if (!handler) {
            return false;
        }
        handler(frame);
        return true;
    }

    int calls() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_calls;
    }

    int stops() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_stops;
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    FrameHandler m_handler;
    bool m_released = false;
    bool m_fail_next = false;
    int m_calls = 0;
    int m_stops = 0;
};

LedFrame frame(const std::string& port, std::vector<LedColor> colors) {
    LedFrame f;
    f.port = port;
    f.colors = std::move(colors);
    return f;
}
}  // namespace

int main() {
    logging::set_min_level(logging::Level::Error);

    {
        // Concurrent callers share one attempt.
        FakeFrameSource source;
        core::ColorStreamDistributor distributor(source);

        std::shared_future<bool> first = distributor.ensure_listening();
        std::shared_future<bool> second = distributor.ensure_listening();
        assert(!distributor.is_listening());

        source.release();
        assert(first.get());
        assert(second.get());
        assert(source.calls() == 1);
        assert(distributor.is_listening());

        assert(distributor.ensure_listening().get());
        assert(source.calls() == 1);

        distributor.shutdown();
        assert(source.stops() == 1);
        assert(!distributor.is_listening());
        assert(!distributor.ensure_listening().get());
    }

    {
        // A failed attempt is retried on the next call.
        FakeFrameSource source;
        source.fail_next();
        source.release();
        core::ColorStreamDistributor distributor(source);

        assert(!distributor.ensure_listening().get());
        assert(!distributor.is_listening());

        assert(distributor.ensure_listening().get());
        assert(source.calls() == 2);
        assert(distributor.is_listening());
    }

    {
        // A channel lost after setup is re-established on the next call.
        FakeFrameSource source;
        source.release();
        core::ColorStreamDistributor distributor(source);
        assert(distributor.ensure_listening().get());
        assert(source.calls() == 1);

        int delivered = 0;
        auto unsubscribe = distributor.subscribe("COM3", [&delivered](const std::vector<LedColor>&) { ++delivered; });

        source.drop();
        assert(!distributor.is_listening());
        assert(!source.emit(frame("COM3", {{1, 1, 1}})));

        assert(distributor.ensure_listening().get());
        assert(source.calls() == 2);
        assert(distributor.is_listening());
        assert(source.emit(frame("COM3", {{2, 2, 2}})));
        assert(delivered == 1);
        unsubscribe();
    }

    {
        FakeFrameSource source;
        source.release();
        core::ColorStreamDistributor distributor(source);
        assert(distributor.ensure_listening().get());

        std::vector<std::vector<LedColor>> received;
        auto unsubscribe = distributor.subscribe("COM3", [&received](const std::vector<LedColor>& colors) {
            received.push_back(colors);
        });
        assert(distributor.subscriber_count("COM3") == 1);

        assert(source.emit(frame("COM3", {{255, 0, 0}, {0, 255, 0}})));
        assert(source.emit(frame("COM4", {{1, 2, 3}})));
        assert(received.size() == 1);
        assert(received[0].size() == 2);
        assert(received[0][1] == (LedColor{0, 255, 0}));

        // Frames for ports nobody watches are still cached.
        auto latest = distributor.get_latest("COM4");
        assert(latest && latest->size() == 1);
        assert(!distributor.get_latest("COM9"));

        unsubscribe();
        unsubscribe();
        assert(distributor.subscriber_count("COM3") == 0);
        assert(source.emit(frame("COM3", {{9, 9, 9}})));
        assert(received.size() == 1);
        assert((*distributor.get_latest("COM3"))[0] == (LedColor{9, 9, 9}));
    }

    {
        // A subscriber may unsubscribe itself and its neighbours mid-dispatch.
        FakeFrameSource source;
        core::ColorStreamDistributor distributor(source);

        int firstCalls = 0;
        int secondCalls = 0;
        core::ColorStreamDistributor::Unsubscribe unsubscribeFirst;
        core::ColorStreamDistributor::Unsubscribe unsubscribeSecond;
        unsubscribeFirst = distributor.subscribe("COM5", [&](const std::vector<LedColor>&) {
            ++firstCalls;
            unsubscribeFirst();
            unsubscribeSecond();
        });
        unsubscribeSecond = distributor.subscribe("COM5", [&](const std::vector<LedColor>&) { ++secondCalls; });

        distributor.publish(frame("COM5", {{1, 1, 1}}));
        distributor.publish(frame("COM5", {{2, 2, 2}}));
        assert(firstCalls == 1);
        assert(secondCalls == 0);
        assert(distributor.subscriber_count("COM5") == 0);
    }

    {
        // A throwing subscriber does not starve the others.
        FakeFrameSource source;
        core::ColorStreamDistributor distributor(source);
        std::atomic<int> delivered{0};
        auto a = distributor.subscribe("COM6", [](const std::vector<LedColor>&) {
            throw std::runtime_error("boom");
        });
        auto b = distributor.subscribe("COM6", [&delivered](const std::vector<LedColor>&) { ++delivered; });
        distributor.publish(frame("COM6", {}));
        assert(delivered == 1);
        a();
        b();
    }

    {
        // Disposers outlive the distributor.
        core::ColorStreamDistributor::Unsubscribe late;
        {
            FakeFrameSource source;
            core::ColorStreamDistributor distributor(source);
            late = distributor.subscribe("COM3", [](const std::vector<LedColor>&) {});
            distributor.shutdown();
            assert(distributor.subscriber_count("COM3") == 0);
            assert(!distributor.get_latest("COM3"));

            bool called = false;
            auto ignored = distributor.subscribe("COM3", [&called](const std::vector<LedColor>&) { called = true; });
            distributor.publish(frame("COM3", {{1, 1, 1}}));
            assert(!called);
            ignored();
        }
        late();
    }

    return 0;
}
