#include "config_io.hpp"
#include "core/logging.hpp"

#include <unistd.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>

namespace {
std::filesystem::path make_temp_dir() {
    auto dir = std::filesystem::temp_directory_path() / ("lightdesk-config-test-" + std::to_string(::getpid()));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

void write_file(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

}  // namespace

int main() {
    logging::set_min_level(logging::Level::Error);
    const auto dir = make_temp_dir();

    {
        const auto path = dir / "full.conf";
        write_file(path,
                   "# lightdesk settings\n"
                   "backend {\n"
                   "    socket_path = /run/user/1000/leds.sock  # daemon\n"
                   "}\n"
                   "stream {\n"
                   "    interval_ms = 50\n"
                   "}\n"
                   "render {\n"
                   "    worker = off\n"
                   "}\n"
                   "log {\n"
                   "    level = debug\n"
                   "}\n");

        auto options = ConfigIO::readOptions(path.string());
        assert(options.size() == 4);
        assert(options["backend:socket_path"] == "/run/user/1000/leds.sock");

        AppSettings settings = ConfigIO::loadSettings(path.string());
        assert(settings.socket_path == "/run/user/1000/leds.sock");
        assert(settings.stream_interval_ms == 50);
        assert(!settings.render_worker);
        assert(settings.log_level == "debug");
    }

    {
        // Missing files and bad values fall back to the defaults.
        AppSettings missing = ConfigIO::loadSettings((dir / "absent.conf").string());
        assert(missing.socket_path.empty());
        assert(missing.stream_interval_ms == 33);
        assert(missing.render_worker);
        assert(missing.log_level == "info");

        const auto path = dir / "bad.conf";
        write_file(path, "stream {\n  interval_ms = fast\n}\nrender {\n  worker = maybe\n}\n");
        AppSettings bad = ConfigIO::loadSettings(path.string());
        assert(bad.stream_interval_ms == 33);
        assert(bad.render_worker);

        write_file(path, "stream {\n  interval_ms = -4\n}\n");
        assert(ConfigIO::loadSettings(path.string()).stream_interval_ms == 33);
    }

    std::filesystem::remove_all(dir);
    return 0;
}
