#include "keyflow/observability/logging.h"

#include <spdlog/spdlog.h>

namespace keyflow::observability {

static spdlog::level::level_enum ToSpdlogLevel(LogLevel level) noexcept {
  switch (level) {
    case LogLevel::Debug:
      return spdlog::level::debug;
    case LogLevel::Info:
      return spdlog::level::info;
    case LogLevel::Warn:
      return spdlog::level::warn;
    case LogLevel::Error:
      return spdlog::level::err;
    case LogLevel::Fatal:
      return spdlog::level::critical;
  }
  return spdlog::level::info;
}

bool IsLogEnabled(LogLevel level) noexcept {
  return spdlog::default_logger_raw()->should_log(ToSpdlogLevel(level));
}

void Log(LogLevel level, std::string_view message, const char* file, int line) {
  spdlog::default_logger_raw()->log(spdlog::source_loc{file, line, ""}, ToSpdlogLevel(level),
                                    spdlog::string_view_t(message.data(), message.size()));
}

}  // namespace keyflow::observability
