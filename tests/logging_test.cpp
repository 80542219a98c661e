#include "core/logging.hpp"

#include <cassert>
#include <string>

int main() {
    {
        std::string line = logging::format_line(logging::Level::Warn, "devices.scan_failed", {{"port", "COM3"}});
        assert(line == "[lightdesk] warn devices.scan_failed port=COM3");
    }

    {
        std::string line = logging::format_line(logging::Level::Error, "backend.request_failed",
                                                {{"error", "cannot connect"}, {"cmd", ""}, {"q", "a\"b"}});
        assert(line == "[lightdesk] error backend.request_failed error=\"cannot connect\" cmd=\"\" q=\"a\\\"b\"");
    }

    {
        logging::Level level = logging::Level::Info;
        assert(logging::parse_level("debug", level) && level == logging::Level::Debug);
        assert(logging::parse_level("warning", level) && level == logging::Level::Warn);
        assert(!logging::parse_level("loud", level));
        assert(level == logging::Level::Warn);

        logging::set_min_level(logging::Level::Error);
        assert(logging::min_level() == logging::Level::Error);
        logging::info("suppressed");
    }

    return 0;
}
