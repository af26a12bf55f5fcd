/**
 * @file Logging.cpp
 * @brief spdlog-backed structured logging
 */

#include "autodeploy/Logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <sstream>

namespace autodeploy {

namespace {

constexpr const char* kLoggerName = "autodeploy";

std::string resolve(const char* env_name, const std::string& configured) {
    if (const char* value = std::getenv(env_name)) {
        return value;
    }
    return configured;
}

} // anonymous namespace

LogField string_field(std::string_view key, std::string_view value) {
    return {std::string(key), std::string(value)};
}

LogField int_field(std::string_view key, std::int64_t value) {
    return {std::string(key), std::to_string(value)};
}

LogField bool_field(std::string_view key, bool value) {
    return {std::string(key), value ? "true" : "false"};
}

void initialize_logging(const LoggingSettings& settings) {
    spdlog::drop(kLoggerName);
    // stderr keeps stdout free for merged output.
    auto logger = spdlog::stderr_color_mt(kLoggerName);
    logger->set_pattern(resolve("AUTODEPLOY_LOG_PATTERN", settings.pattern));
    logger->set_level(spdlog::level::from_str(resolve("AUTODEPLOY_LOG_LEVEL", settings.level)));
    spdlog::set_default_logger(std::move(logger));
    spdlog::flush_on(spdlog::level::warn);
}

void shutdown_logging() {
    spdlog::shutdown();
}

std::string format_fields(std::initializer_list<LogField> fields) {
    std::ostringstream out;
    bool first = true;
    for (const auto& field : fields) {
        if (!first) {
            out << ' ';
        }
        first = false;
        out << field.key << '=' << field.value;
    }
    return out.str();
}

void log(spdlog::level::level_enum level, std::string_view message,
         std::initializer_list<LogField> fields) {
    auto serialized = format_fields(fields);
    if (serialized.empty()) {
        spdlog::log(level, "{}", message);
        return;
    }
    spdlog::log(level, "{} {}", message, serialized);
}

} // namespace autodeploy
