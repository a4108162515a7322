#include <seekline/utils/logger.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <string>

namespace seekline::logger {

namespace {
struct LevelName {
    const char *name;
    spdlog::level::level_enum level;
};

constexpr LevelName LEVEL_NAMES[] = {
    {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
    {"warning", spdlog::level::warn}, {"err", spdlog::level::err},
    {"error", spdlog::level::err},   {"critical", spdlog::level::critical},
    {"off", spdlog::level::off}};

spdlog::level::level_enum parse_level(std::string level_str) {
    std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    for (const auto &entry : LEVEL_NAMES) {
        if (level_str == entry.name) {
            return entry.level;
        }
    }
    return spdlog::level::info;
}
}  // namespace

int set_log_level(const std::string &level_str) {
    if (level_str.empty()) {
        return -1;
    }
    spdlog::set_level(parse_level(level_str));
    return 0;
}

int set_log_level_int(int level) {
    if (level < spdlog::level::trace || level > spdlog::level::off) {
        return -1;
    }
    spdlog::set_level(static_cast<spdlog::level::level_enum>(level));
    return 0;
}

std::string get_log_level_string() {
    switch (spdlog::get_level()) {
        case spdlog::level::trace:
            return "trace";
        case spdlog::level::debug:
            return "debug";
        case spdlog::level::info:
            return "info";
        case spdlog::level::warn:
            return "warn";
        case spdlog::level::err:
            return "error";
        case spdlog::level::critical:
            return "critical";
        case spdlog::level::off:
            return "off";
        default:
            return "info";
    }
}

int get_log_level_int() { return static_cast<int>(spdlog::get_level()); }

void use_stderr_logger() {
    auto logger = spdlog::get("stderr");
    if (!logger) {
        logger = spdlog::stderr_color_mt("stderr");
    }
    spdlog::set_default_logger(logger);
}

}  // namespace seekline::logger

// ==============================================================================
// C API Implementation (wraps C++ implementation)
// ==============================================================================

extern "C" {

int seekline_set_log_level(const char *level_str) {
    if (!level_str) {
        return -1;
    }
    return seekline::logger::set_log_level(level_str);
}

int seekline_set_log_level_int(int level) {
    return seekline::logger::set_log_level_int(level);
}

const char *seekline_get_log_level_string(void) {
    static std::string level_string;
    level_string = seekline::logger::get_log_level_string();
    return level_string.c_str();
}

int seekline_get_log_level_int(void) {
    return seekline::logger::get_log_level_int();
}

}  // extern "C"
