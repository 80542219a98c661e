#include "ui/led_painter.hpp"

#include <algorithm>
#include <cmath>

namespace {
void set_source(const Cairo::RefPtr<Cairo::Context>& cr, const ui::Rgba& color) {
    cr->set_source_rgba(color.r, color.g, color.b, color.a);
}

void set_source(const Cairo::RefPtr<Cairo::Context>& cr, const LedColor& color) {
    cr->set_source_rgb(color.r / 255.0, color.g / 255.0, color.b / 255.0);
}

struct GridSpec {
    double origin_x = 0.0;
    double origin_y = 0.0;
    int cols = 0;
    int rows = 0;
    double size = 0.0;
    double gap = 0.0;
    int led_start_index = 0;
    int led_count = 0;
    bool is_matrix = false;
    const std::optional<std::vector<std::optional<int>>>* matrix_map = nullptr;
};

void paint_grid(const Cairo::RefPtr<Cairo::Context>& cr, const GridSpec& grid, const std::vector<LedColor>& colors,
                bool is_default) {
    if (grid.cols <= 0 || grid.rows <= 0 || grid.size <= 0.0) {
        return;
    }
    const double radius = ui::cell_corner_radius(grid.size, grid.is_matrix);

    for (int row = 0; row < grid.rows; ++row) {
        for (int col = 0; col < grid.cols; ++col) {
            const int i = row * grid.cols + col;
            if (!grid.is_matrix && i >= grid.led_count) {
                continue;
            }

            const double x = grid.origin_x + col * (grid.size + grid.gap);
            const double y = grid.origin_y + row * (grid.size + grid.gap);
            ui::rounded_rect_path(cr, x, y, grid.size, grid.size, radius);

            auto color = ui::cell_color(colors, grid.led_start_index, i, grid.is_matrix, *grid.matrix_map);
            if (!color) {
                set_source(cr, ui::kEmptyCellFill);
            } else if (is_default) {
                set_source(cr, ui::kDefaultFill);
            } else {
                set_source(cr, *color);
            }
            cr->fill();
        }
    }
}
}  // namespace

namespace ui {
double cell_corner_radius(double size, bool is_matrix) {
    return is_matrix ? std::min(2.0, size / 2.0) : std::min(4.0, size / 2.0);
}

double active_frame_radius(double size) {
    return std::min(10.0, std::max(6.0, size));
}

void rounded_rect_path(const Cairo::RefPtr<Cairo::Context>& cr, double x, double y, double w, double h, double r) {
    const double radius = std::max(0.0, std::min({r, w / 2.0, h / 2.0}));
    cr->begin_new_sub_path();
    cr->arc(x + w - radius, y + radius, radius, -M_PI / 2.0, 0.0);
    cr->arc(x + w - radius, y + h - radius, radius, 0.0, M_PI / 2.0);
    cr->arc(x + radius, y + h - radius, radius, M_PI / 2.0, M_PI);
    cr->arc(x + radius, y + radius, radius, M_PI, 3.0 * M_PI / 2.0);
    cr->close_path();
}

std::optional<LedColor> cell_color(const std::vector<LedColor>& colors, int led_start_index, int cell,
                                   bool is_matrix, const std::optional<std::vector<std::optional<int>>>& matrix_map) {
    int offset = cell;
    if (is_matrix && matrix_map && cell >= 0 && static_cast<std::size_t>(cell) < matrix_map->size()) {
        const auto& entry = (*matrix_map)[static_cast<std::size_t>(cell)];
        if (!entry) {
            return std::nullopt;
        }
        offset = *entry;
    }

    const long long index = static_cast<long long>(led_start_index) + offset;
    if (index < 0 || static_cast<unsigned long long>(index) >= colors.size()) {
        return LedColor{};
    }
    return colors[static_cast<std::size_t>(index)];
}

void paint_multi_layout(const Cairo::RefPtr<Cairo::Context>& cr, const core::MultiLayoutData& layout,
                        const std::vector<LedColor>& colors, bool is_default) {
    if (layout.size <= 0.0) {
        return;
    }

    for (const auto& block : layout.blocks) {
        GridSpec grid;
        grid.origin_x = block.x;
        grid.origin_y = block.y;
        grid.cols = block.cols;
        grid.rows = block.rows;
        grid.size = layout.size;
        grid.gap = layout.gap;
        grid.led_start_index = block.led_start_index;
        grid.led_count = block.led_count;
        grid.is_matrix = block.is_matrix;
        grid.matrix_map = &block.matrix_map;
        paint_grid(cr, grid, colors, is_default);

        if (block.is_active) {
            const double pad = core::kHighlightPad;
            cr->set_line_width(1.0);
            // Half-pixel offset keeps the 1px stroke crisp.
            rounded_rect_path(cr, block.x - pad + 0.5, block.y - pad + 0.5, block.width + pad * 2.0 - 1.0,
                              block.height + pad * 2.0 - 1.0, active_frame_radius(layout.size));
            set_source(cr, kActiveFrame);
            cr->stroke();
        }
    }
}

void paint_zone_layout(const Cairo::RefPtr<Cairo::Context>& cr, const core::ZoneLayout& layout,
                       const std::vector<LedColor>& colors, bool is_default) {
    GridSpec grid;
    grid.origin_x = layout.offset_x;
    grid.origin_y = layout.offset_y;
    grid.cols = layout.cols;
    grid.rows = layout.rows;
    grid.size = layout.size;
    grid.gap = layout.gap;
    grid.led_start_index = layout.led_start_index;
    grid.led_count = layout.total_leds;
    grid.is_matrix = layout.is_matrix;
    grid.matrix_map = &layout.matrix_map;
    paint_grid(cr, grid, colors, is_default);
}
}  // namespace ui
