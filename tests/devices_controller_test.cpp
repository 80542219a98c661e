#include "core/logging.hpp"
#include "fake_daemon.hpp"
#include "features/devices_controller.hpp"

#include <cassert>
#include <string>

namespace {
const std::string kStrip =
    R"({"port":"COM3","model":"Strip Controller","outputs":[{"id":"out-0","name":"Strip","output_type":"Linear","leds_count":30,)"
    R"("brightness":{"value":100,"is_following":true}}]})";

const std::string kHub =
    R"({"port":"COM5","model":"Desk Hub","brightness":{"value":70},"outputs":[)"
    R"({"id":"a","name":"Shelf","output_type":"Linear","leds_count":10,"brightness":{"value":100,"is_following":true},)"
    R"("segments":[{"id":"a1","name":"Left","segment_type":"Linear","leds_count":10,"brightness":{"value":100,"is_following":true}}]},)"
    R"({"id":"b","name":"Panel","output_type":"Matrix","leds_count":4,"brightness":{"value":100,"is_following":true},)"
    R"("matrix":{"width":2,"height":2,"map":[0,1,2,3]}}]})";

std::string device_list(const std::string& devices) {
    return R"({"ok":true,"result":[)" + devices + "]}";
}

ScopeRef scope(const std::string& port, std::optional<std::string> output_id = std::nullopt,
               std::optional<std::string> segment_id = std::nullopt) {
    ScopeRef s;
    s.port = port;
    s.output_id = std::move(output_id);
    s.segment_id = std::move(segment_id);
    return s;
}

const OutputPort& output_of(const DevicesController& controller, const std::string& port, std::size_t index) {
    return controller.find_device(port)->outputs[index];
}
}  // namespace

int main() {
    logging::set_min_level(logging::Level::Error);

    test_daemon::FakeDaemon daemon(test_daemon::socket_path("controller"));
    daemon.respond("scan_devices", device_list(kStrip + "," + kHub));
    daemon.respond("get_effects", R"({"ok":true,"result":[{"id":"rainbow","name":"Rainbow"},{"id":"static","name":"Static"}]})");
    daemon.respond("set_scope_effect", R"({"ok":true})");
    daemon.respond("set_scope_brightness", R"({"ok":true})");
    daemon.respond("update_scope_effect_params", R"({"ok":true})");

    LightdeskBackend backend(daemon.path());
    DevicesController controller(backend);

    {
        assert(!controller.selected_scope());
        assert(controller.rescan());
        assert(controller.devices().size() == 2);
        assert(controller.status_message() == "Found 2 device(s)");
        assert(!controller.status_is_error());

        // The first device is picked, collapsed onto its only output.
        assert(controller.selected_scope() == scope("COM3", std::string("out-0")));
        assert(controller.selected_device()->model == "Strip Controller");

        assert(controller.load_effects());
        assert(controller.effects().size() == 2);
    }

    {
        controller.select_scope(scope("COM5", std::string("a"), std::string("a1")));
        assert(controller.selected_scope() == scope("COM5", std::string("a"), std::string("a1")));

        daemon.respond("get_devices", device_list(kHub));
        assert(controller.refresh());
        assert(controller.selected_scope() == scope("COM5", std::string("a"), std::string("a1")));

        // The selected device went away.
        daemon.respond("get_devices", device_list(kStrip));
        assert(controller.refresh());
        assert(controller.selected_scope() == scope("COM3", std::string("out-0")));

        daemon.respond("get_devices", device_list(""));
        assert(controller.refresh());
        assert(controller.devices().empty());
        assert(!controller.selected_scope());
        assert(!controller.selected_device());
        assert(controller.status_message() == "No devices found");
        assert(!controller.status_is_error());
    }

    {
        assert(controller.rescan());
        daemon.respond("get_devices", R"({"ok":false,"error":"bus error"})");
        assert(!controller.refresh());
        assert(controller.status_is_error());
        assert(controller.status_message() == "Error scanning devices");
        // The previous snapshot stays in place.
        assert(controller.devices().size() == 2);
    }

    {
        const ScopeRef shelf = scope("COM5", std::string("a"));
        assert(controller.set_scope_effect(shelf, std::string("rainbow")));
        assert(controller.status_message() == "Effect set to rainbow");

        const OutputPort& a = output_of(controller, "COM5", 0);
        assert(a.mode.selected_effect_id == std::optional<std::string>("rainbow"));
        assert(a.segments[0].mode.effective_effect_id == std::optional<std::string>("rainbow"));
        assert(a.segments[0].mode.effective_from == shelf);

        assert(controller.update_scope_effect_params(shelf, EffectParams{{"speed", 3.0}}));
        assert(controller.status_message() == "Effect parameters updated");
        const OutputPort& updated = output_of(controller, "COM5", 0);
        assert(updated.mode.effective_params);
        assert(std::get<double>(updated.mode.effective_params->at("speed")) == 3.0);
        assert(updated.segments[0].mode.effective_params);

        // Params sent to a scope that only inherits leave the snapshot alone.
        assert(controller.update_scope_effect_params(scope("COM5", std::string("b")), EffectParams{{"speed", 9.0}}));
        assert(!output_of(controller, "COM5", 1).mode.effective_params);

        assert(controller.set_scope_effect(shelf, std::nullopt));
        assert(controller.status_message() == "Effect now inherited");
        assert(!output_of(controller, "COM5", 0).mode.effective_effect_id);
        assert(daemon.request_count("set_scope_effect") == 2);
    }

    {
        const ScopeRef left = scope("COM5", std::string("a"), std::string("a1"));
        assert(output_of(controller, "COM5", 0).segments[0].brightness.effective_value == 70);

        assert(controller.set_scope_brightness(left, 140));
        assert(controller.status_message() == "Brightness set to 100%");
        const Segment& segment = output_of(controller, "COM5", 0).segments[0];
        assert(!segment.brightness.is_following);
        assert(segment.brightness.value == 100);
        assert(segment.brightness.effective_from == left);

        daemon.respond("set_scope_brightness", R"({"ok":false,"error":"read-only"})");
        assert(!controller.set_scope_brightness(scope("COM5"), 10));
        assert(controller.status_is_error());
        assert(controller.status_message() == "Failed to set brightness: read-only");
        assert(controller.find_device("COM5")->brightness.value == 70);
    }

    {
        daemon.respond("set_scope_effect", R"({"ok":false,"error":"unsupported"})");
        assert(!controller.set_scope_effect(scope("COM3", std::string("out-0")), std::string("static")));
        assert(controller.status_message() == "Failed to set effect: unsupported");
        assert(!output_of(controller, "COM3", 0).mode.selected_effect_id);
    }

    return 0;
}
