#ifndef CONFIG_IO_HPP
#define CONFIG_IO_HPP

#include <map>
#include <string>

struct AppSettings {
    // Empty means the built-in default path.
    std::string socket_path;
    int stream_interval_ms = 33;
    bool render_worker = true;
    std::string log_level = "info";
};

class ConfigIO {
public:
    static std::string defaultConfigPath();

    // Flattens "section { key = value }" blocks into "section:key" entries.
    static std::map<std::string, std::string> readOptions(const std::string& filePath);
    static AppSettings loadSettings(const std::string& filePath);
};

#endif // CONFIG_IO_HPP
