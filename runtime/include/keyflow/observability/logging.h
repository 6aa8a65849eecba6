#pragma once

#include <fmt/core.h>

#include <string_view>
#include <utility>

namespace keyflow::observability {

enum class LogLevel { Debug, Info, Warn, Error, Fatal };

// Emit a preformatted message through the default logger.
void Log(LogLevel level, std::string_view message, const char* file, int line);

bool IsLogEnabled(LogLevel level) noexcept;

// ------------------------------------------------------------
// Lazy formatting helper
//
// Formatting is skipped entirely when the level is disabled.
// ------------------------------------------------------------
template <typename... Args>
inline void LogFmt(LogLevel level, const char* file, int line, fmt::format_string<Args...> fmt_str,
                   Args&&... args) {
  if (!IsLogEnabled(level))
    return;

  Log(level, fmt::format(fmt_str, std::forward<Args>(args)...), file, line);
}

}  // namespace keyflow::observability

// ============================================================
// fmt logging macros
// ============================================================

#define KF_LOG_DEBUG_FMT(fmt, ...)                                                       \
  ::keyflow::observability::LogFmt(::keyflow::observability::LogLevel::Debug, __FILE__, \
                                   __LINE__, fmt, ##__VA_ARGS__)

#define KF_LOG_INFO_FMT(fmt, ...)                                                                 \
  ::keyflow::observability::LogFmt(::keyflow::observability::LogLevel::Info, __FILE__, __LINE__, \
                                   fmt, ##__VA_ARGS__)

#define KF_LOG_WARN_FMT(fmt, ...)                                                                 \
  ::keyflow::observability::LogFmt(::keyflow::observability::LogLevel::Warn, __FILE__, __LINE__, \
                                   fmt, ##__VA_ARGS__)

#define KF_LOG_ERROR_FMT(fmt, ...)                                                       \
  ::keyflow::observability::LogFmt(::keyflow::observability::LogLevel::Error, __FILE__, \
                                   __LINE__, fmt, ##__VA_ARGS__)

#define KF_LOG_FATAL_FMT(fmt, ...)                                                       \
  ::keyflow::observability::LogFmt(::keyflow::observability::LogLevel::Fatal, __FILE__, \
                                   __LINE__, fmt, ##__VA_ARGS__)
