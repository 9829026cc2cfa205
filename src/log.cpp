#include "gitstack/log.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <string>

namespace gitstack::log {

logger_t make_logger(std::string_view name, spdlog::level::level_enum level) {
  const std::string log_name(name);
  logger_t logger = spdlog::get(log_name);
  if (!logger) {
    logger = spdlog::stderr_color_mt(log_name);
    logger->set_pattern("%^%l%$: %v");
  }
  logger->set_level(level);
  return logger;
}

logger_t null_logger() {
  static const logger_t logger =
      std::make_shared<spdlog::logger>("null", std::make_shared<spdlog::sinks::null_sink_mt>());
  return logger;
}

logger_t or_null(logger_t logger) { return logger ? std::move(logger) : null_logger(); }

std::optional<spdlog::level::level_enum> parse_level(std::string_view name) {
  using namespace spdlog::level;
  if (name == "trace")
    return trace;
  if (name == "debug")
    return debug;
  if (name == "info")
    return info;
  if (name == "warn")
    return warn;
  if (name == "error")
    return err;
  if (name == "off")
    return off;
  return std::nullopt;
}

} // namespace gitstack::log
