#ifndef MODSCOUT_HELPERS_LOG_HPP
#define MODSCOUT_HELPERS_LOG_HPP
/**
 * @file Log.hpp
 * @brief Injectable log sink for library code.
 *
 * Library functions never print. They accept an optional LogSink and report
 * through it; an empty sink turns every call into a no-op. CLI tools install
 * stderrSink() to get "[LEVEL] message" lines.
 *
 * @note Cold-path only: formatting allocates.
 */

#include <cstdint>
#include <cstdio>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace modscout {
namespace helpers {
namespace log {

/* ----------------------------- Types ----------------------------- */

/// Message severity, ordered from most to least verbose.
enum class LogLevel : std::uint8_t {
  DEBUG = 0,
  INFO,
  WARN,
  ERROR,
};

/// Receives one fully formatted message. Must not throw.
using LogSink = std::function<void(LogLevel, std::string_view)>;

/* ----------------------------- API ----------------------------- */

/// @brief Fixed-width level tag ("DEBUG", "INFO", "WARN", "ERROR").
[[nodiscard]] inline const char* toString(LogLevel level) noexcept {
  switch (level) {
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  }
  return "UNKNOWN";
}

/**
 * @brief Format and forward a message to a sink.
 * @param sink Destination; when empty the message is not even formatted.
 * @param level Severity.
 * @param fmtStr fmt format string.
 * @param args Format arguments.
 */
template <typename... Args>
inline void logMsg(const LogSink& sink, LogLevel level, fmt::format_string<Args...> fmtStr,
                   Args&&... args) {
  if (!sink) {
    return;
  }
  const std::string MSG = fmt::format(fmtStr, std::forward<Args>(args)...);
  sink(level, MSG);
}

/**
 * @brief Sink writing "[LEVEL] message" lines to stderr.
 * @param minLevel Messages below this level are dropped.
 */
[[nodiscard]] inline LogSink stderrSink(LogLevel minLevel = LogLevel::INFO) {
  return [minLevel](LogLevel level, std::string_view msg) {
    if (level < minLevel) {
      return;
    }
    fmt::print(stderr, "[{}] {}\n", toString(level), msg);
  };
}

} // namespace log
} // namespace helpers
} // namespace modscout

#endif // MODSCOUT_HELPERS_LOG_HPP
