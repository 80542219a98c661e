#ifndef UI_LED_VISUALIZER_HPP
#define UI_LED_VISUALIZER_HPP

#include "core/layout.hpp"
#include "core/models.hpp"
#include "core/zones.hpp"
#include "ui/render_worker.hpp"

#include <gtkmm.h>

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ui {
class LedVisualizer : public Gtk::DrawingArea {
public:
    explicit LedVisualizer(bool use_worker);
    ~LedVisualizer() override;

    void set_device(const Device* device, const std::optional<ScopeRef>& scope);
    void set_colors(const std::vector<LedColor>& colors);
    void set_scope_activated_handler(std::function<void(const ScopeRef&)> handler);

private:
    void on_draw(const Cairo::RefPtr<Cairo::Context>& cr, int width, int height);
    void on_size_changed(int width, int height);
    void on_pressed(int n_press, double x, double y);
    bool on_query_tooltip(int x, int y, bool keyboard_tooltip, const Glib::RefPtr<Gtk::Tooltip>& tooltip);
    void on_presented();

    void post_init();
    void relayout();
    void post_frame();
    bool single_zone() const;

    std::string m_port;
    std::optional<ScopeRef> m_scope;
    std::vector<core::ProcessedZone> m_zones;
    core::MultiLayoutData m_multi;
    core::ZoneLayout m_zone;
    std::vector<LedColor> m_colors;
    bool m_has_frame = false;
    std::function<void(const ScopeRef&)> m_on_activate;

    std::unique_ptr<RenderWorker> m_worker;
    double m_worker_dpr = 1.0;
    Glib::Dispatcher m_presented;
    std::mutex m_image_mutex;
    Cairo::RefPtr<Cairo::ImageSurface> m_pending_image;
    Cairo::RefPtr<Cairo::ImageSurface> m_image;
};
}  // namespace ui

#endif
