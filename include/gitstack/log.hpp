#pragma once

#include <memory>
#include <optional>
#include <string_view>

#include <spdlog/spdlog.h>

namespace gitstack::log {

using logger_t = std::shared_ptr<spdlog::logger>;

// Logger named `name` writing to stderr; reuses an already registered logger of that name.
logger_t make_logger(std::string_view name, spdlog::level::level_enum level);

// A logger that drops everything. Components fall back to it when given nullptr.
logger_t null_logger();

// Returns `logger` or null_logger() when it is empty.
logger_t or_null(logger_t logger);

// "trace" | "debug" | "info" | "warn" | "error" | "off"
std::optional<spdlog::level::level_enum> parse_level(std::string_view name);

} // namespace gitstack::log
