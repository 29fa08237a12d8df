#include "utils/debug_log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

namespace debug_log {

static std::atomic<int> minimum_level{static_cast<int>(Level::Info)};
static std::mutex output_mutex;

static std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

static bool is_debug_env_set() {
    const char *value = std::getenv("MCPROXY_DEBUG");
    if (value == nullptr || value[0] == '\0') {
        return false;
    }
    std::string normalized = to_lower(std::string(value));
    return (normalized == "1" || normalized == "true" || normalized == "yes");
}

static const char *level_tag(Level level) {
    switch (level) {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warning:
        return "WARNING";
    case Level::Error:
        return "ERROR";
    }
    return "INFO";
}

static void write_line(Level level, const std::string &message) {
    if (static_cast<int>(level) < minimum_level.load() &&
        !(level == Level::Debug && is_debug_env_set())) {
        return;
    }
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cerr << "[mcproxy] " << level_tag(level) << " " << message << std::endl;
}

bool is_debug_enabled() {
    return minimum_level.load() == static_cast<int>(Level::Debug) || is_debug_env_set();
}

void set_level(Level level) {
    minimum_level.store(static_cast<int>(level));
}

bool parse_level(const std::string &name, Level &output_level) {
    std::string normalized = to_lower(name);
    if (normalized == "debug") {
        output_level = Level::Debug;
    } else if (normalized == "info") {
        output_level = Level::Info;
    } else if (normalized == "warning" || normalized == "warn") {
        output_level = Level::Warning;
    } else if (normalized == "error") {
        output_level = Level::Error;
    } else {
        return false;
    }
    return true;
}

void log(const std::string &message) {
    write_line(Level::Debug, message);
}

void info(const std::string &message) {
    write_line(Level::Info, message);
}

void warning(const std::string &message) {
    write_line(Level::Warning, message);
}

void error(const std::string &message) {
    write_line(Level::Error, message);
}

} // namespace debug_log
