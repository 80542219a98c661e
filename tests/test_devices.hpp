#ifndef TESTS_TEST_DEVICES_HPP
#define TESTS_TEST_DEVICES_HPP

#include "core/models.hpp"

#include <optional>
#include <string>
#include <vector>

namespace test_devices {
inline Segment segment(const std::string& id, const std::string& name, int leds) {
    Segment s;
    s.id = id;
    s.name = name;
    s.segment_type = SegmentType::Linear;
    s.leds_count = leds;
    s.brightness.is_following = true;
    return s;
}

inline OutputPort linear_output(const std::string& id, const std::string& name, int leds,
                                std::vector<Segment> segments = {}) {
    OutputPort o;
    o.id = id;
    o.name = name;
    o.output_type = SegmentType::Linear;
    o.leds_count = leds;
    o.segments = std::move(segments);
    o.brightness.is_following = true;
    return o;
}

inline OutputPort matrix_output(const std::string& id, const std::string& name, int width, int height) {
    OutputPort o;
    o.id = id;
    o.name = name;
    o.output_type = SegmentType::Matrix;
    o.leds_count = width * height;
    MatrixMap matrix;
    matrix.width = width;
    matrix.height = height;
    for (int i = 0; i < width * height; ++i) {
        matrix.map.push_back(i);
    }
    o.matrix = matrix;
    o.brightness.is_following = true;
    return o;
}

inline Device device(const std::string& port, const std::string& model, std::vector<OutputPort> outputs) {
    Device d;
    d.port = port;
    d.model = model;
    d.id = port;
    d.outputs = std::move(outputs);
    return d;
}

inline ScopeRef scope(const std::string& port, std::optional<std::string> output_id = std::nullopt,
                      std::optional<std::string> segment_id = std::nullopt) {
    ScopeRef s;
    s.port = port;
    s.output_id = std::move(output_id);
    s.segment_id = std::move(segment_id);
    return s;
}

// COM3: a single 30-LED strip.
inline Device single_strip() {
    return device("COM3", "Strip Controller", {linear_output("out-0", "Strip", 30)});
}

// COM5: a strip split into two segments plus a 4x4 matrix.
inline Device two_outputs() {
    return device("COM5", "Desk Hub",
                  {linear_output("a", "Shelf", 10, {segment("a1", "Left", 10)}),
                   matrix_output("b", "Panel", 4, 4)});
}

// COM7: two segmented strips.
inline Device segmented_pair() {
    return device("COM7", "Case Lights",
                  {linear_output("front", "Front", 20, {segment("f1", "Top", 8), segment("f2", "Bottom", 12)}),
                   linear_output("rear", "Rear", 6)});
}
}  // namespace test_devices

#endif
