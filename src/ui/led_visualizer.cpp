#include "ui/led_visualizer.hpp"

#include "ui/led_painter.hpp"

#include <utility>

namespace ui {
LedVisualizer::LedVisualizer(bool use_worker) {
    set_expand(true);
    set_content_width(320);
    set_content_height(160);
    add_css_class("led-visualizer");
    set_draw_func(sigc::mem_fun(*this, &LedVisualizer::on_draw));
    signal_resize().connect(sigc::mem_fun(*this, &LedVisualizer::on_size_changed));

    auto click = Gtk::GestureClick::create();
    click->signal_pressed().connect(sigc::mem_fun(*this, &LedVisualizer::on_pressed));
    add_controller(click);

    set_has_tooltip(true);
    signal_query_tooltip().connect(sigc::mem_fun(*this, &LedVisualizer::on_query_tooltip), false);

    if (use_worker) {
        m_presented.connect(sigc::mem_fun(*this, &LedVisualizer::on_presented));
        m_worker = std::make_unique<RenderWorker>();
        m_worker_dpr = get_scale_factor();
        post_init();
    }
}

LedVisualizer::~LedVisualizer() {
    // Joins the worker before the dispatcher it emits on goes away.
    m_worker.reset();
}

void LedVisualizer::set_scope_activated_handler(std::function<void(const ScopeRef&)> handler) {
    m_on_activate = std::move(handler);
}

void LedVisualizer::set_device(const Device* device, const std::optional<ScopeRef>& scope) {
    const std::string port = device ? device->port : std::string();
    if (port != m_port) {
        m_colors.clear();
        m_has_frame = false;
    }
    m_port = port;
    m_scope = scope;

    if (device) {
        m_zones = core::filter_visible_zones(core::project_zones(*device).zones, scope);
    } else {
        m_zones.clear();
    }

    relayout();
    post_frame();
}

void LedVisualizer::set_colors(const std::vector<LedColor>& colors) {
    m_colors = colors;
    m_has_frame = true;
    post_frame();
}

bool LedVisualizer::single_zone() const {
    return m_zones.size() == 1 && m_scope && m_scope->output_id.has_value();
}

// The presenter runs on the worker thread.
void LedVisualizer::post_init() {
    m_worker->post(RenderWorker::Init{
        Cairo::ImageSurface::create(Cairo::Surface::Format::ARGB32, 1, 1), m_worker_dpr,
        [this](Cairo::RefPtr<Cairo::ImageSurface> image) {
            {
                std::lock_guard<std::mutex> lock(m_image_mutex);
                m_pending_image = std::move(image);
            }
            m_presented.emit();
        }});
}

void LedVisualizer::relayout() {
    const double width = get_width();
    const double height = get_height();

    if (single_zone()) {
        m_zone = core::compute_zone_layout(width, height, m_zones.front());
        m_multi = core::MultiLayoutData();
        if (m_worker) {
            m_worker->post(RenderWorker::Layout{m_zone});
        }
    } else {
        m_multi = core::compute_layout(width, height, m_zones, m_scope);
        m_zone = core::ZoneLayout();
        if (m_worker) {
            m_worker->post(RenderWorker::Layout{m_multi});
        }
    }

    if (!m_worker) {
        queue_draw();
    }
}

void LedVisualizer::post_frame() {
    if (!m_worker) {
        queue_draw();
        return;
    }

    RenderWorker::Frame frame;
    if (m_has_frame) {
        frame.colors = m_colors;
    }
    frame.is_default = !m_has_frame;
    m_worker->post(std::move(frame));
}

void LedVisualizer::on_size_changed(int, int) {
    if (m_worker) {
        const double dpr = get_scale_factor();
        if (dpr != m_worker_dpr) {
            m_worker_dpr = dpr;
            post_init();
        }
    }
    relayout();
    post_frame();
}

void LedVisualizer::on_presented() {
    {
        std::lock_guard<std::mutex> lock(m_image_mutex);
        m_image = m_pending_image;
    }
    queue_draw();
}

void LedVisualizer::on_draw(const Cairo::RefPtr<Cairo::Context>& cr, int, int) {
    if (m_worker) {
        if (!m_image) {
            return;
        }
        cr->save();
        cr->scale(1.0 / m_worker_dpr, 1.0 / m_worker_dpr);
        cr->set_source(m_image, 0.0, 0.0);
        cr->paint();
        cr->restore();
        return;
    }

    if (single_zone()) {
        paint_zone_layout(cr, m_zone, m_colors, !m_has_frame);
    } else {
        paint_multi_layout(cr, m_multi, m_colors, !m_has_frame);
    }
}

void LedVisualizer::on_pressed(int, double x, double y) {
    if (single_zone() || !m_on_activate) {
        return;
    }
    auto index = core::block_at(m_multi, x, y);
    if (!index) {
        return;
    }
    const core::BlockLayout& block = m_multi.blocks[*index];
    m_on_activate(ScopeRef{m_port, block.output_id, block.segment_id});
}

bool LedVisualizer::on_query_tooltip(int x, int y, bool, const Glib::RefPtr<Gtk::Tooltip>& tooltip) {
    if (single_zone()) {
        return false;
    }
    auto index = core::block_at(m_multi, x, y);
    if (!index) {
        return false;
    }
    tooltip->set_text(m_multi.blocks[*index].title);
    return true;
}
}  // namespace ui
