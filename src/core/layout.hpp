#ifndef CORE_LAYOUT_HPP
#define CORE_LAYOUT_HPP

#include "core/models.hpp"
#include "core/zones.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace core {
struct BlockLayout {
    std::size_t zone_index = 0;
    std::string output_id;
    std::optional<std::string> segment_id;
    std::string label;
    std::string title;
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
    int cols = 0;
    int rows = 0;
    int led_start_index = 0;
    int led_count = 0;
    std::optional<std::vector<std::optional<int>>> matrix_map;
    bool is_matrix = false;
    bool is_active = false;
};

struct MultiLayoutData {
    double width = 0.0;
    double height = 0.0;
    double size = 0.0;
    double gap = 0.0;
    double block_gap = 0.0;
    std::vector<BlockLayout> blocks;
};

// One zone filling the whole viewport, centered.
struct ZoneLayout {
    double width = 0.0;
    double height = 0.0;
    int cols = 0;
    int rows = 0;
    double gap = 0.0;
    double size = 0.0;
    double offset_x = 0.0;
    double offset_y = 0.0;
    bool is_matrix = false;
    std::optional<std::vector<std::optional<int>>> matrix_map;
    int total_leds = 0;
    int led_start_index = 0;
};

constexpr double kCellGap = 1.0;
constexpr double kBlockGap = 16.0;
constexpr double kRowGap = 12.0;
constexpr double kHighlightPad = 6.0;
constexpr double kHitFramePad = 10.0;
constexpr double kMaxCellSize = 64.0;
constexpr int kSizeSearchIterations = 18;

// Wraps a linear run to the viewport aspect ratio.
GridShape reflow_linear_grid(int led_count, double viewport_aspect);

MultiLayoutData compute_layout(double width, double height, const std::vector<ProcessedZone>& zones,
                               const std::optional<ScopeRef>& scope = std::nullopt);

ZoneLayout compute_zone_layout(double width, double height, const ProcessedZone& zone);

std::optional<std::size_t> block_at(const MultiLayoutData& layout, double x, double y);
}  // namespace core

#endif
