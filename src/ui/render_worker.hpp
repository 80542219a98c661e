#ifndef UI_RENDER_WORKER_HPP
#define UI_RENDER_WORKER_HPP

#include "core/layout.hpp"
#include "core/models.hpp"

#include <cairomm/surface.h>

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <variant>
#include <vector>

namespace ui {
// Paints LED frames off the UI thread. All state lives on the worker thread;
// the outside world talks to it through post() only.
class RenderWorker {
public:
    using Presenter = std::function<void(Cairo::RefPtr<Cairo::ImageSurface>)>;

    struct Init {
        Cairo::RefPtr<Cairo::ImageSurface> surface;
        double dpr = 1.0;
        Presenter presenter;
    };
    struct Layout {
        std::variant<core::MultiLayoutData, core::ZoneLayout> data;
    };
    struct Frame {
        std::optional<std::vector<LedColor>> colors;
        bool is_default = false;
    };
    struct Dispose {};

    using Message = std::variant<Init, Layout, Frame, Dispose>;

    RenderWorker();
    ~RenderWorker();

    RenderWorker(const RenderWorker&) = delete;
    RenderWorker& operator=(const RenderWorker&) = delete;

    // A frame queued behind another frame replaces it.
    void post(Message message);
    bool running() const;

private:
    struct State;

    void run();

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<Message> m_queue;
    bool m_running = true;
    std::thread m_thread;
};
}  // namespace ui

#endif
