#include "core/layout.hpp"

#include <algorithm>
#include <cmath>
#include <set>

namespace {
struct PackedZone {
    std::size_t index = 0;
    double width = 0.0;
    double height = 0.0;
    int cols = 0;
    int rows = 0;
};

struct PackedRow {
    std::vector<PackedZone> zones;
    double width = 0.0;
    double height = 0.0;
};

struct Packing {
    std::vector<PackedRow> rows;
    double total_height = 0.0;
};

struct PackingInput {
    const std::vector<core::ProcessedZone>* zones = nullptr;
    double content_width = 0.0;
    bool detail_mode = false;
    double viewport_aspect = 1.0;
};

double grid_extent(double size, int cells) {
    return cells > 0 ? size * cells + core::kCellGap * (cells - 1) : 0.0;
}

double floor_to_half(double value) {
    return std::floor(value * 2.0) / 2.0;
}

std::optional<Packing> pack_rows(const PackingInput& input, double size) {
    if (size <= 0.0) {
        return std::nullopt;
    }

    Packing packing;
    PackedRow current;

    const auto& zones = *input.zones;
    for (std::size_t i = 0; i < zones.size(); ++i) {
        const auto& zone = zones[i];

        int cols = zone.cols;
        int rows = zone.rows;
        if (!zone.is_matrix && input.detail_mode && zone.led_count > 0) {
            const core::GridShape shape = core::reflow_linear_grid(zone.led_count, input.viewport_aspect);
            cols = shape.cols;
            rows = shape.rows;
        }

        const double w = grid_extent(size, cols);
        const double h = grid_extent(size, rows);
        if (w > input.content_width) {
            return std::nullopt;
        }

        if (!current.zones.empty() && current.width + core::kBlockGap + w > input.content_width) {
            packing.rows.push_back(std::move(current));
            current = PackedRow();
        }

        current.width = current.zones.empty() ? w : current.width + core::kBlockGap + w;
        current.height = std::max(current.height, h);
        current.zones.push_back(PackedZone{i, w, h, cols, rows});
    }

    if (!current.zones.empty()) {
        packing.rows.push_back(std::move(current));
    }

    for (const auto& row : packing.rows) {
        packing.total_height += row.height;
    }
    if (packing.rows.size() > 1) {
        packing.total_height += core::kRowGap * static_cast<double>(packing.rows.size() - 1);
    }
    return packing;
}
}  // namespace

namespace core {
GridShape reflow_linear_grid(int led_count, double viewport_aspect) {
    GridShape shape;
    if (led_count <= 0) {
        return shape;
    }
    const double wanted = std::ceil(std::sqrt(led_count * std::max(0.15, viewport_aspect)));
    shape.cols = std::max(1, std::min(led_count, static_cast<int>(wanted)));
    shape.rows = (led_count + shape.cols - 1) / shape.cols;
    return shape;
}

MultiLayoutData compute_layout(double width, double height, const std::vector<ProcessedZone>& zones,
                               const std::optional<ScopeRef>& scope) {
    MultiLayoutData layout;
    layout.width = width;
    layout.height = height;
    if (width <= 0.0 || height <= 0.0 || zones.empty()) {
        return layout;
    }
    layout.gap = kCellGap;
    layout.block_gap = kBlockGap;

    const bool highlight_enabled = zones.size() > 1;
    std::set<std::string> output_ids;
    for (const auto& zone : zones) {
        output_ids.insert(zone.output_id);
    }
    const bool multi_output = output_ids.size() > 1;

    // Room for the hover/active frame around each block.
    const double highlight_pad = highlight_enabled ? kHighlightPad : 0.0;
    const double left_padding = highlight_pad + 4.0;
    const double right_padding = highlight_pad + 8.0;
    const double top_padding = highlight_pad + 8.0;
    const double bottom_padding = highlight_pad + 4.0;

    const double content_width = std::max(0.0, width - left_padding - right_padding);
    const double content_height = std::max(0.0, height - top_padding - bottom_padding);

    PackingInput input;
    input.zones = &zones;
    input.content_width = content_width;
    input.detail_mode = scope.has_value() && (scope->output_id.has_value() || scope->segment_id.has_value());
    input.viewport_aspect = content_height > 0.0 ? content_width / content_height : 1.0;

    const double max_candidate = std::min(kMaxCellSize, std::max(1.0, std::min(content_width, content_height)));
    double lo = 0.0;
    double hi = max_candidate;
    std::optional<double> best;
    for (int iter = 0; iter < kSizeSearchIterations; ++iter) {
        const double mid = (lo + hi) / 2.0;
        const auto built = pack_rows(input, mid);
        if (built && built->total_height <= content_height) {
            best = mid;
            lo = mid;
        } else {
            hi = mid;
        }
    }

    // 0.5px steps keep near-identical inputs from jittering by a pixel.
    double size = best ? floor_to_half(*best) : 0.0;
    std::optional<Packing> packing = pack_rows(input, size);
    while (packing && packing->total_height > content_height && size > 0.0) {
        size -= 0.5;
        packing = pack_rows(input, size);
    }
    if (!packing) {
        return layout;
    }
    layout.size = size;

    double y = top_padding;
    for (const auto& row : packing->rows) {
        double x = width - right_padding - row.width;

        for (const auto& item : row.zones) {
            const ProcessedZone& zone = zones[item.index];

            bool is_active = false;
            if (highlight_enabled && scope) {
                if (scope->segment_id) {
                    is_active = zone.segment_id == scope->segment_id && zone.output_id == scope->output_id;
                } else if (scope->output_id && multi_output) {
                    is_active = zone.output_id == *scope->output_id;
                }
            }

            BlockLayout block;
            block.zone_index = item.index;
            block.output_id = zone.output_id;
            block.segment_id = zone.segment_id;
            block.label = zone.segment_id ? zone.name : zone.output_name;
            block.title = zone.segment_id ? zone.output_name + " / " + zone.name : zone.output_name;
            block.x = x;
            block.y = y;
            block.width = item.width;
            block.height = item.height;
            block.cols = item.cols;
            block.rows = item.rows;
            block.led_start_index = zone.led_start_index;
            block.led_count = zone.led_count;
            block.matrix_map = zone.matrix_map;
            block.is_matrix = zone.is_matrix;
            block.is_active = is_active;
            layout.blocks.push_back(std::move(block));

            x += item.width + kBlockGap;
        }

        y += row.height + kRowGap;
    }

    return layout;
}

ZoneLayout compute_zone_layout(double width, double height, const ProcessedZone& zone) {
    ZoneLayout layout;
    layout.width = width;
    layout.height = height;
    layout.gap = kCellGap;
    layout.is_matrix = zone.is_matrix;
    layout.matrix_map = zone.matrix_map;
    layout.total_leds = zone.led_count;
    layout.led_start_index = zone.led_start_index;
    if (width <= 0.0 || height <= 0.0) {
        return layout;
    }

    GridShape shape{zone.cols, zone.rows};
    if (!zone.is_matrix && zone.led_count > 0) {
        shape = reflow_linear_grid(zone.led_count, width / height);
    }
    if (shape.cols <= 0 || shape.rows <= 0) {
        return layout;
    }

    const double fit_w = (width - kCellGap * (shape.cols - 1)) / shape.cols;
    const double fit_h = (height - kCellGap * (shape.rows - 1)) / shape.rows;
    const double size = floor_to_half(std::min(kMaxCellSize, std::min(fit_w, fit_h)));
    if (size <= 0.0) {
        return layout;
    }

    layout.cols = shape.cols;
    layout.rows = shape.rows;
    layout.size = size;
    layout.offset_x = (width - grid_extent(size, shape.cols)) / 2.0;
    layout.offset_y = (height - grid_extent(size, shape.rows)) / 2.0;
    return layout;
}

std::optional<std::size_t> block_at(const MultiLayoutData& layout, double x, double y) {
    if (layout.blocks.size() <= 1) {
        return std::nullopt;
    }

    for (std::size_t i = 0; i < layout.blocks.size(); ++i) {
        const BlockLayout& block = layout.blocks[i];
        const double left = std::max(0.0, block.x - kHitFramePad);
        const double top = std::max(0.0, block.y - kHitFramePad);
        const double right = std::min(layout.width, block.x + block.width + kHitFramePad);
        const double bottom = std::min(layout.height, block.y + block.height + kHitFramePad);
        if (x >= left && x < right && y >= top && y < bottom) {
            return i;
        }
    }
    return std::nullopt;
}
}  // namespace core
