#include "ui/render_worker.hpp"

#include "core/logging.hpp"
#include "ui/led_painter.hpp"

#include <cairomm/context.h>

#include <cmath>
#include <exception>
#include <utility>

namespace ui {
struct RenderWorker::State {
    Cairo::RefPtr<Cairo::ImageSurface> surface;
    double dpr = 1.0;
    Presenter presenter;
    std::optional<std::variant<core::MultiLayoutData, core::ZoneLayout>> layout;
    std::optional<Frame> frame;

    void draw() {
        if (!presenter || !layout || !frame) {
            return;
        }

        double width = 0.0;
        double height = 0.0;
        if (const auto* multi = std::get_if<core::MultiLayoutData>(&*layout)) {
            width = multi->width;
            height = multi->height;
        } else {
            const auto& zone = std::get<core::ZoneLayout>(*layout);
            width = zone.width;
            height = zone.height;
        }
        const int pixel_w = static_cast<int>(std::ceil(width * dpr));
        const int pixel_h = static_cast<int>(std::ceil(height * dpr));
        if (pixel_w <= 0 || pixel_h <= 0) {
            return;
        }

        if (!surface || surface->get_width() != pixel_w || surface->get_height() != pixel_h) {
            surface = Cairo::ImageSurface::create(Cairo::Surface::Format::ARGB32, pixel_w, pixel_h);
        }

        auto cr = Cairo::Context::create(surface);
        cr->set_operator(Cairo::Context::Operator::CLEAR);
        cr->paint();
        cr->set_operator(Cairo::Context::Operator::OVER);
        cr->scale(dpr, dpr);

        static const std::vector<LedColor> kNoColors;
        const std::vector<LedColor>& colors = frame->colors ? *frame->colors : kNoColors;
        if (const auto* multi = std::get_if<core::MultiLayoutData>(&*layout)) {
            paint_multi_layout(cr, *multi, colors, frame->is_default);
        } else {
            paint_zone_layout(cr, std::get<core::ZoneLayout>(*layout), colors, frame->is_default);
        }
        surface->flush();

        // The presenter owns what it receives; the working surface is reused.
        auto image = Cairo::ImageSurface::create(Cairo::Surface::Format::ARGB32, pixel_w, pixel_h);
        auto copy = Cairo::Context::create(image);
        copy->set_source(surface, 0.0, 0.0);
        copy->paint();
        image->flush();
        presenter(image);
    }
};

RenderWorker::RenderWorker() {
    m_thread = std::thread(&RenderWorker::run, this);
}

RenderWorker::~RenderWorker() {
    post(Dispose{});
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

void RenderWorker::post(Message message) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            return;
        }
        if (std::holds_alternative<Frame>(message) && !m_queue.empty() &&
            std::holds_alternative<Frame>(m_queue.back())) {
            m_queue.back() = std::move(message);
        } else {
            m_queue.push_back(std::move(message));
        }
    }
    m_cv.notify_one();
}

bool RenderWorker::running() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_running;
}

void RenderWorker::run() {
    State state;
    for (;;) {
        Message message;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this]() { return !m_queue.empty(); });
            message = std::move(m_queue.front());
            m_queue.pop_front();

            if (std::holds_alternative<Dispose>(message)) {
                m_running = false;
                m_queue.clear();
                break;
            }
        }

        try {
            if (auto* init = std::get_if<Init>(&message)) {
                state.surface = std::move(init->surface);
                state.dpr = init->dpr > 0.0 ? init->dpr : 1.0;
                state.presenter = std::move(init->presenter);
            } else if (auto* layout = std::get_if<Layout>(&message)) {
                state.layout = std::move(layout->data);
                state.draw();
            } else if (auto* frame = std::get_if<Frame>(&message)) {
                state.frame = std::move(*frame);
                state.draw();
            }
        } catch (const std::exception& e) {
            logging::error("render.worker_failed", {{"error", e.what()}});
        }
    }
    logging::debug("render.worker_stopped");
}
}  // namespace ui
