#include "config_io.hpp"
#include "core/logging.hpp"
#include "lighting_window.hpp"

#include <cstdlib>

int main(int argc, char* argv[])
{
    AppSettings settings = ConfigIO::loadSettings(ConfigIO::defaultConfigPath());

    logging::Level level = logging::Level::Info;
    if (logging::parse_level(settings.log_level, level)) {
        logging::set_min_level(level);
    } else {
        logging::warn("config.invalid_value", {{"key", "log:level"}, {"value", settings.log_level}});
    }

    // The environment wins over the config file.
    const char* socketEnv = std::getenv("LIGHTDESK_SOCKET");
    if (socketEnv && *socketEnv != '\0') {
        settings.socket_path = socketEnv;
    }

    auto app = Gtk::Application::create("org.lightdesk.app");
    return app->make_window_and_run<LightingWindow>(argc, argv, settings);
}
