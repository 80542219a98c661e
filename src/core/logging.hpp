#ifndef CORE_LOGGING_HPP
#define CORE_LOGGING_HPP

#include <string>
#include <utility>
#include <vector>

namespace logging {
enum class Level {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

using Context = std::vector<std::pair<std::string, std::string>>;

void set_min_level(Level level);
Level min_level();
bool parse_level(const std::string& text, Level& level);

// One line per event on stderr: "[lightdesk] warn devices.scan_failed port=COM3".
void write(Level level, const std::string& event, const Context& context = {});
std::string format_line(Level level, const std::string& event, const Context& context);

inline void debug(const std::string& event, const Context& context = {}) { write(Level::Debug, event, context); }
inline void info(const std::string& event, const Context& context = {}) { write(Level::Info, event, context); }
inline void warn(const std::string& event, const Context& context = {}) { write(Level::Warn, event, context); }
inline void error(const std::string& event, const Context& context = {}) { write(Level::Error, event, context); }
}  // namespace logging

#endif
