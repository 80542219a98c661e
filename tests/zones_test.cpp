#include "core/zones.hpp"
#include "test_devices.hpp"

#include <cassert>
#include <climits>
#include <string>

using namespace test_devices;

int main() {
    {
        core::GridShape shape = core::square_grid(10);
        assert(shape.cols == 4 && shape.rows == 3);
        shape = core::square_grid(16);
        assert(shape.cols == 4 && shape.rows == 4);
        shape = core::square_grid(0);
        assert(shape.cols == 0 && shape.rows == 0);
        shape = core::square_grid(INT_MAX);
        assert(shape.cols == 46341 && shape.rows == 46341);
    }

    {
        core::ZoneProjection projection = core::project_zones(two_outputs());
        assert(projection.zones.size() == 2);

        const core::ProcessedZone& a = projection.zones[0];
        assert(a.output_id == "a");
        assert(a.segment_id == std::optional<std::string>("a1"));
        assert(a.led_start_index == 0);
        assert(a.led_count == 10);
        assert(a.cols == 4 && a.rows == 3);
        assert(!a.is_matrix);

        const core::ProcessedZone& b = projection.zones[1];
        assert(b.output_id == "b");
        assert(!b.segment_id);
        assert(b.led_start_index == 10);
        assert(b.led_count == 16);
        assert(b.cols == 4 && b.rows == 4);
        assert(b.is_matrix);
        assert(b.matrix_map && b.matrix_map->size() == 16);

        assert(projection.total_leds == 26);
    }

    {
        core::ZoneProjection projection = core::project_zones(segmented_pair());
        int expected_start = 0;
        int sum = 0;
        for (const auto& zone : projection.zones) {
            assert(zone.led_start_index == expected_start);
            expected_start += zone.led_count;
            sum += zone.led_count;
        }
        assert(projection.zones.size() == 3);
        assert(sum == projection.total_leds);
        assert(projection.zones[2].name == "Rear");
    }

    {
        // A matrix without usable dimensions falls back to the auto-grid.
        Device odd = device("COM8", "Odd", {matrix_output("m", "Grid", 0, 0)});
        odd.outputs[0].leds_count = 5;
        core::ZoneProjection projection = core::project_zones(odd);
        assert(!projection.zones[0].is_matrix);
        assert(projection.zones[0].cols == 3 && projection.zones[0].rows == 2);
    }

    {
        core::ZoneProjection projection = core::project_zones(device("COM9", "Empty", {}));
        assert(projection.zones.empty());
        assert(projection.total_leds == 1);
    }

    {
        // Offsets past the int range saturate instead of wrapping.
        Device huge = device("COM10", "Huge",
                             {linear_output("a", "A", INT_MAX), linear_output("b", "B", INT_MAX), linear_output("c", "C", 4)});
        core::ZoneProjection projection = core::project_zones(huge);
        assert(projection.zones.size() == 3);
        assert(projection.zones[1].led_start_index == INT_MAX);
        assert(projection.zones[2].led_start_index == INT_MAX);
        assert(projection.total_leds == INT_MAX);
    }

    {
        auto zones = core::project_zones(segmented_pair()).zones;
        assert(core::filter_visible_zones(zones, std::nullopt).size() == 3);
        assert(core::filter_visible_zones(zones, scope("COM7")).size() == 3);
        assert(core::filter_visible_zones(zones, scope("COM7", std::string("front"))).size() == 2);

        auto one = core::filter_visible_zones(zones, scope("COM7", std::string("front"), std::string("f2")));
        assert(one.size() == 1);
        assert(one[0].name == "Bottom");
        assert(one[0].led_start_index == 8);
    }

    return 0;
}
