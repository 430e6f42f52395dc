#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace genesis {

struct LogField {
    std::string key;
    std::string value;
};

LogField str_field(std::string_view key, std::string_view value);
LogField int_field(std::string_view key, std::int64_t value);

struct LoggingOptions {
    std::string level = "info";
    std::string pattern;
};

/**
 * @brief Installs the `genesis` stderr logger as spdlog's default logger.
 *
 * GENESIS_LOG_LEVEL and GENESIS_LOG_PATTERN take precedence over @p options.
 */
void init_logging(const LoggingOptions &options = {});
void shutdown_logging();

void log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void log_debug(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::debug, message, fields);
}

inline void log_info(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::info, message, fields);
}

inline void log_warn(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::warn, message, fields);
}

inline void log_error(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::err, message, fields);
}

} // namespace genesis

#define GENESIS_LOG_DEBUG(message, ...) ::genesis::log_debug((message) __VA_OPT__(, ) __VA_ARGS__)
#define GENESIS_LOG_INFO(message, ...) ::genesis::log_info((message) __VA_OPT__(, ) __VA_ARGS__)
#define GENESIS_LOG_WARN(message, ...) ::genesis::log_warn((message) __VA_OPT__(, ) __VA_ARGS__)
#define GENESIS_LOG_ERROR(message, ...) ::genesis::log_error((message) __VA_OPT__(, ) __VA_ARGS__)
