#ifndef CORE_ZONES_HPP
#define CORE_ZONES_HPP

#include "core/models.hpp"

#include <optional>
#include <string>
#include <vector>

namespace core {
// A rectangular run of LEDs: one segment of a Linear output, or a whole output.
struct ProcessedZone {
    std::string id;
    std::string output_id;
    std::string output_name;
    std::optional<std::string> segment_id;
    SegmentType type = SegmentType::Linear;
    std::string name;
    int led_start_index = 0;
    int led_count = 0;
    int cols = 0;
    int rows = 0;
    std::optional<std::vector<std::optional<int>>> matrix_map;
    bool is_matrix = false;
};

struct ZoneProjection {
    std::vector<ProcessedZone> zones;
    int total_leds = 1;
};

struct GridShape {
    int cols = 0;
    int rows = 0;
};

// ceil(sqrt(n)) columns, as many rows as needed.
GridShape square_grid(int led_count);

ZoneProjection project_zones(const Device& device);
std::vector<ProcessedZone> filter_visible_zones(const std::vector<ProcessedZone>& zones,
                                                const std::optional<ScopeRef>& scope);
}  // namespace core

#endif
