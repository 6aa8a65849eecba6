#include "keyflow/observability/local_logging.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace keyflow::observability {

void InitLocalLogging(bool debug) {
  // Records are written to stdout by sinks, keep logs on stderr
  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();

  auto logger = std::make_shared<spdlog::logger>("keyflow", sink);

  // Timestamp + level + message
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  logger->set_level(debug ? spdlog::level::debug : spdlog::level::info);

  spdlog::set_default_logger(logger);

  // Never throw from logging
  spdlog::set_error_handler([](const std::string&) {});
}

}  // namespace keyflow::observability
