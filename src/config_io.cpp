#include "config_io.hpp"

#include "core/logging.hpp"

#include <cstdlib>
#include <fstream>
#include <functional>
#include <stdexcept>
#include <vector>

namespace {
std::string trim(const std::string& text) {
    const char* ws = " \t\r\n";
    size_t start = text.find_first_not_of(ws);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(ws);
    return text.substr(start, end - start + 1);
}

std::string strip_comment(const std::string& line) {
    size_t pos = line.find('#');
    return pos == std::string::npos ? line : line.substr(0, pos);
}

std::string join_path(const std::vector<std::string>& sections, const std::string& key) {
    std::string path;
    for (const auto& section : sections) {
        path += section + ":";
    }
    return path + key;
}

// Walks the block structure and reports every key with its line index.
void scan_lines(const std::vector<std::string>& lines,
                const std::function<void(size_t, const std::string&, const std::string&)>& on_key) {
    std::vector<std::string> sections;
    for (size_t i = 0; i < lines.size(); ++i) {
        std::string content = trim(strip_comment(lines[i]));
        if (content.empty()) {
            continue;
        }
        if (content.back() == '{') {
            sections.push_back(trim(content.substr(0, content.size() - 1)));
            continue;
        }
        if (content == "}") {
            if (!sections.empty()) {
                sections.pop_back();
            }
            continue;
        }
        size_t eq = content.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string key = trim(content.substr(0, eq));
        if (key.empty()) {
            continue;
        }
        on_key(i, join_path(sections, key), trim(content.substr(eq + 1)));
    }
}

bool read_lines(const std::string& filePath, std::vector<std::string>& lines) {
    std::ifstream inFile(filePath);
    if (!inFile.is_open()) {
        return false;
    }
    std::string line;
    while (std::getline(inFile, line)) {
        lines.push_back(line);
    }
    return true;
}

bool parse_bool(const std::string& text, bool fallback) {
    if (text == "true" || text == "1" || text == "yes" || text == "on") {
        return true;
    }
    if (text == "false" || text == "0" || text == "no" || text == "off") {
        return false;
    }
    return fallback;
}
}  // namespace

std::string ConfigIO::defaultConfigPath() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg != '\0') {
        return std::string(xdg) + "/lightdesk/lightdesk.conf";
    }
    const char* home = std::getenv("HOME");
    return home ? std::string(home) + "/.config/lightdesk/lightdesk.conf" : "lightdesk.conf";
}

std::map<std::string, std::string> ConfigIO::readOptions(const std::string& filePath) {
    std::map<std::string, std::string> options;
    std::vector<std::string> lines;
    if (!read_lines(filePath, lines)) {
        return options;
    }
    scan_lines(lines, [&options](size_t, const std::string& path, const std::string& value) {
        options[path] = value;
    });
    return options;
}

AppSettings ConfigIO::loadSettings(const std::string& filePath) {
    AppSettings settings;
    const auto options = readOptions(filePath);

    auto it = options.find("backend:socket_path");
    if (it != options.end()) {
        settings.socket_path = it->second;
    }

    it = options.find("stream:interval_ms");
    if (it != options.end()) {
        try {
            int interval = std::stoi(it->second);
            if (interval >= 0) {
                settings.stream_interval_ms = interval;
            } else {
                logging::warn("config.invalid_value", {{"key", it->first}, {"value", it->second}});
            }
        } catch (const std::exception&) {
            logging::warn("config.invalid_value", {{"key", it->first}, {"value", it->second}});
        }
    }

    it = options.find("render:worker");
    if (it != options.end()) {
        settings.render_worker = parse_bool(it->second, settings.render_worker);
    }

    it = options.find("log:level");
    if (it != options.end()) {
        settings.log_level = it->second;
    }

    return settings;
}
