#include "core/zones.hpp"

#include <algorithm>
#include <climits>
#include <cmath>

namespace {
int saturate(long long value) {
    return static_cast<int>(std::min<long long>(value, INT_MAX));
}
}  // namespace

namespace core {
GridShape square_grid(int led_count) {
    GridShape shape;
    if (led_count <= 0) {
        return shape;
    }
    shape.cols = static_cast<int>(std::ceil(std::sqrt(static_cast<double>(led_count))));
    shape.rows = static_cast<int>((static_cast<long long>(led_count) + shape.cols - 1) / shape.cols);
    return shape;
}

ZoneProjection project_zones(const Device& device) {
    ZoneProjection projection;
    long long offset = 0;

    for (const auto& output : device.outputs) {
        if (output.output_type == SegmentType::Linear && !output.segments.empty()) {
            for (const auto& segment : output.segments) {
                const int count = std::max(0, segment.leds_count);
                const GridShape shape = square_grid(count);

                ProcessedZone zone;
                zone.id = segment.id;
                zone.output_id = output.id;
                zone.output_name = output.name;
                zone.segment_id = segment.id;
                zone.type = segment.segment_type;
                zone.name = segment.name;
                zone.led_start_index = saturate(offset);
                zone.led_count = count;
                zone.cols = shape.cols;
                zone.rows = shape.rows;
                projection.zones.push_back(std::move(zone));
                offset += count;
            }
            continue;
        }

        const int count = std::max(0, output.leds_count);
        const bool is_matrix = output.output_type == SegmentType::Matrix && output.matrix.has_value() &&
                               output.matrix->width > 0 && output.matrix->height > 0;

        ProcessedZone zone;
        zone.id = output.id;
        zone.output_id = output.id;
        zone.output_name = output.name;
        zone.type = output.output_type;
        zone.name = output.name;
        zone.led_start_index = saturate(offset);
        zone.led_count = count;
        zone.is_matrix = is_matrix;
        if (is_matrix) {
            zone.cols = output.matrix->width;
            zone.rows = output.matrix->height;
            zone.matrix_map = output.matrix->map;
        } else {
            const GridShape shape = square_grid(count);
            zone.cols = shape.cols;
            zone.rows = shape.rows;
        }
        projection.zones.push_back(std::move(zone));
        offset += count;
    }

    projection.total_leds = std::max(1, saturate(offset));
    return projection;
}

std::vector<ProcessedZone> filter_visible_zones(const std::vector<ProcessedZone>& zones,
                                                const std::optional<ScopeRef>& scope) {
    if (!scope || !scope->output_id) {
        return zones;
    }

    std::vector<ProcessedZone> visible;
    for (const auto& zone : zones) {
        if (zone.output_id != *scope->output_id) {
            continue;
        }
        if (scope->segment_id && zone.segment_id != scope->segment_id) {
            continue;
        }
        visible.push_back(zone);
    }
    return visible;
}
}  // namespace core
