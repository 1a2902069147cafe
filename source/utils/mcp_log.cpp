#include "utils/mcp_log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace mcp_log {

namespace {

std::mutex stderr_mutex;
std::atomic<int> threshold{-1};

std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

bool is_truthy(const char *value) {
    if (value == nullptr || value[0] == '\0') {
        return false;
    }
    std::string normalized = to_lower(std::string(value));
    return (normalized == "1" || normalized == "true" || normalized == "yes");
}

const char *level_label(Level level) {
    switch (level) {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warn:
        return "WARN";
    case Level::Error:
        return "ERROR";
    default:
        return "OFF";
    }
}

void write_line(Level level, const std::string &message) {
    if (static_cast<int>(level) < static_cast<int>(current_level())) {
        return;
    }
    std::lock_guard<std::mutex> lock(stderr_mutex);
    std::cerr << "[" << level_label(level) << "] " << message << std::endl;
}

} // namespace

Level parse_level(const std::string &text, Level fallback) {
    std::string normalized = to_lower(text);
    if (normalized == "debug") {
        return Level::Debug;
    }
    if (normalized == "info") {
        return Level::Info;
    }
    if (normalized == "warn" || normalized == "warning") {
        return Level::Warn;
    }
    if (normalized == "error") {
        return Level::Error;
    }
    if (normalized == "off" || normalized == "none") {
        return Level::Off;
    }
    return fallback;
}

Level level_from_environment() {
    if (is_truthy(std::getenv("TOOLWIRE_DEBUG"))) {
        return Level::Debug;
    }
    const char *value = std::getenv("TOOLWIRE_LOG_LEVEL");
    if (value == nullptr) {
        return Level::Info;
    }
    return parse_level(value, Level::Info);
}

Level current_level() {
    int value = threshold.load();
    if (value < 0) {
        value = static_cast<int>(level_from_environment());
        int expected = -1;
        // A concurrent set_level() wins over the environment default.
        if (!threshold.compare_exchange_strong(expected, value)) {
            value = expected;
        }
    }
    return static_cast<Level>(value);
}

void set_level(Level level) {
    threshold.store(static_cast<int>(level));
}

bool is_debug_enabled() {
    return current_level() == Level::Debug;
}

void debug(const std::string &message) {
    write_line(Level::Debug, message);
}

void info(const std::string &message) {
    write_line(Level::Info, message);
}

void warn(const std::string &message) {
    write_line(Level::Warn, message);
}

void error(const std::string &message) {
    write_line(Level::Error, message);
}

} // namespace mcp_log
