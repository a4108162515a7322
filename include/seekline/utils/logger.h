#ifndef SEEKLINE_UTILS_LOGGER_H
#define SEEKLINE_UTILS_LOGGER_H

#ifdef __cplusplus
extern "C" {
#endif
/**
 * Set the global spdlog log level by name (case insensitive): "trace",
 * "debug", "info", "warn"/"warning", "err"/"error", "critical", "off".
 * Unknown names select "info".
 * @return 0 on success, -1 if level_str is NULL or empty
 */
int seekline_set_log_level(const char *level_str);

/**
 * Set the global spdlog log level, 0=trace ... 6=off
 * @return 0 on success, -1 if level is out of range
 */
int seekline_set_log_level_int(int level);

/**
 * Current log level name (pointer to static storage)
 */
const char *seekline_get_log_level_string(void);

int seekline_get_log_level_int(void);

#ifdef __cplusplus
}

#include <string>

namespace seekline::logger {
int set_log_level(const std::string &level_str);
int set_log_level_int(int level);
std::string get_log_level_string();
int get_log_level_int();

/**
 * Route the default logger to stderr so that logs never mix with lines
 * printed on stdout
 */
void use_stderr_logger();
}  // namespace seekline::logger
#endif

#endif  // SEEKLINE_UTILS_LOGGER_H
