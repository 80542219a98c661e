#ifndef UI_LED_PAINTER_HPP
#define UI_LED_PAINTER_HPP

#include "core/layout.hpp"
#include "core/models.hpp"

#include <cairomm/context.h>

#include <optional>
#include <vector>

namespace ui {
struct Rgba {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;
    double a = 1.0;
};

// Placeholder while no frame has arrived yet.
constexpr Rgba kDefaultFill{128.0 / 255.0, 128.0 / 255.0, 128.0 / 255.0, 0.2};
// Matrix cells with no LED behind them.
constexpr Rgba kEmptyCellFill{1.0, 1.0, 1.0, 0.06};
constexpr Rgba kActiveFrame{1.0, 1.0, 1.0, 0.55};

double cell_corner_radius(double size, bool is_matrix);
double active_frame_radius(double size);

void rounded_rect_path(const Cairo::RefPtr<Cairo::Context>& cr, double x, double y, double w, double h, double r);

// Color for cell `cell` of a grid whose first LED is `led_start_index`;
// empty when a matrix cell has no LED.
std::optional<LedColor> cell_color(const std::vector<LedColor>& colors, int led_start_index, int cell,
                                   bool is_matrix, const std::optional<std::vector<std::optional<int>>>& matrix_map);

void paint_multi_layout(const Cairo::RefPtr<Cairo::Context>& cr, const core::MultiLayoutData& layout,
                        const std::vector<LedColor>& colors, bool is_default);
void paint_zone_layout(const Cairo::RefPtr<Cairo::Context>& cr, const core::ZoneLayout& layout,
                       const std::vector<LedColor>& colors, bool is_default);
}  // namespace ui

#endif
