#include "genesis/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <sstream>
#include <string>

namespace genesis {

namespace {

std::string resolve_level(const LoggingOptions &options) {
    if (const char *level = std::getenv("GENESIS_LOG_LEVEL")) {
        return level;
    }
    if (!options.level.empty()) {
        return options.level;
    }
    return "info";
}

std::string resolve_pattern(const LoggingOptions &options) {
    if (const char *pattern = std::getenv("GENESIS_LOG_PATTERN")) {
        return pattern;
    }
    if (!options.pattern.empty()) {
        return options.pattern;
    }
    return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

std::string serialize_fields(std::initializer_list<LogField> fields) {
    std::ostringstream out;
    bool first = true;
    for (const auto &field : fields) {
        if (!first) {
            out << ' ';
        }
        first = false;
        out << field.key << '=' << field.value;
    }
    return out.str();
}

} // namespace

LogField str_field(std::string_view key, std::string_view value) {
    return {std::string(key), std::string(value)};
}

LogField int_field(std::string_view key, std::int64_t value) {
    return {std::string(key), std::to_string(value)};
}

void init_logging(const LoggingOptions &options) {
    auto logger = spdlog::get("genesis");
    if (!logger) {
        logger = spdlog::stderr_color_mt("genesis");
    }
    logger->set_pattern(resolve_pattern(options));
    logger->set_level(spdlog::level::from_str(resolve_level(options)));
    spdlog::set_default_logger(std::move(logger));
    spdlog::flush_on(spdlog::level::warn);
}

void shutdown_logging() {
    spdlog::shutdown();
}

void log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
    auto serialized = serialize_fields(fields);
    if (serialized.empty()) {
        spdlog::log(level, "{}", message);
        return;
    }
    spdlog::log(level, "{} {}", message, serialized);
}

} // namespace genesis
