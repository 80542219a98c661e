#include "core/logging.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>

namespace {
std::atomic<int> g_min_level{static_cast<int>(logging::Level::Info)};
std::mutex g_write_mutex;

const char* level_name(logging::Level level) {
    switch (level) {
        case logging::Level::Debug: return "debug";
        case logging::Level::Info: return "info";
        case logging::Level::Warn: return "warn";
        case logging::Level::Error: return "error";
    }
    return "info";
}

bool needs_quotes(const std::string& value) {
    return value.empty() || value.find_first_of(" \t\"=") != std::string::npos;
}
}  // namespace

namespace logging {
void set_min_level(Level level) {
    g_min_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

Level min_level() {
    return static_cast<Level>(g_min_level.load(std::memory_order_relaxed));
}

bool parse_level(const std::string& text, Level& level) {
    if (text == "debug") {
        level = Level::Debug;
    } else if (text == "info") {
        level = Level::Info;
    } else if (text == "warn" || text == "warning") {
        level = Level::Warn;
    } else if (text == "error") {
        level = Level::Error;
    } else {
        return false;
    }
    return true;
}

std::string format_line(Level level, const std::string& event, const Context& context) {
    std::ostringstream line;
    line << "[lightdesk] " << level_name(level) << ' ' << event;
    for (const auto& kv : context) {
        line << ' ' << kv.first << '=';
        if (needs_quotes(kv.second)) {
            line << '"';
            for (char c : kv.second) {
                if (c == '"') {
                    line << "\\\"";
                } else {
                    line << c;
                }
            }
            line << '"';
        } else {
            line << kv.second;
        }
    }
    return line.str();
}

void write(Level level, const std::string& event, const Context& context) {
    if (static_cast<int>(level) < g_min_level.load(std::memory_order_relaxed)) {
        return;
    }
    const std::string line = format_line(level, event, context);
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << line << '\n';
}
}  // namespace logging
