/**
 * @file Logging.hpp
 * @brief Structured logging on top of spdlog
 *
 * Messages are rendered as `message key=value key=value`. The default
 * spdlog logger is used, so nothing is printed with custom formatting
 * until initialize_logging() installs the engine's logger.
 */

#ifndef AUTODEPLOY_LOGGING_HPP
#define AUTODEPLOY_LOGGING_HPP

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace autodeploy {

struct LogField {
    std::string key;
    std::string value;
};

LogField string_field(std::string_view key, std::string_view value);
LogField int_field(std::string_view key, std::int64_t value);
LogField bool_field(std::string_view key, bool value);

/**
 * @brief `logging.*` settings
 */
struct LoggingSettings {
    std::string level = "info";
    std::string pattern = "%Y-%m-%dT%H:%M:%S.%e [%^%l%$] %v";
};

/**
 * @brief Install the "autodeploy" stderr logger as spdlog's default
 *
 * AUTODEPLOY_LOG_LEVEL and AUTODEPLOY_LOG_PATTERN take precedence over
 * `settings`. Calling it again replaces the logger.
 */
void initialize_logging(const LoggingSettings& settings);

void shutdown_logging();

/// Render the fields part of a log line ("a=1 b=x")
std::string format_fields(std::initializer_list<LogField> fields);

void log(spdlog::level::level_enum level, std::string_view message,
         std::initializer_list<LogField> fields = {});

inline void log_info(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::info, message, fields);
}

inline void log_warn(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::warn, message, fields);
}

inline void log_error(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::err, message, fields);
}

} // namespace autodeploy

#define AUTODEPLOY_LOG_INFO(message, ...) ::autodeploy::log_info((message), ##__VA_ARGS__)
#define AUTODEPLOY_LOG_WARN(message, ...) ::autodeploy::log_warn((message), ##__VA_ARGS__)
#define AUTODEPLOY_LOG_ERROR(message, ...) ::autodeploy::log_error((message), ##__VA_ARGS__)

#endif // AUTODEPLOY_LOGGING_HPP
