/**
 * @file log.hpp
 * @brief Logging macros that compile out below TANDEM_LOG_LEVEL
 */

#ifndef TANDEM_JSON_LOG_HPP
#define TANDEM_JSON_LOG_HPP

#include <chrono>
#include <cstdio>
#include <string>

// Log levels: higher means more verbose
#define TANDEM_LOG_LEVEL_OFF 0
#define TANDEM_LOG_LEVEL_ERROR 1 // Broken invariants
#define TANDEM_LOG_LEVEL_WARN 2  // Failures surfaced to the caller
#define TANDEM_LOG_LEVEL_INFO 3  // Per-parse and per-stream events
#define TANDEM_LOG_LEVEL_TRACE 4 // Per-chunk and per-stage events

#define TANDEM_LOG_DEFAULT_STREAM stderr

#ifndef TANDEM_LOG_LEVEL
#define TANDEM_LOG_LEVEL TANDEM_LOG_LEVEL_WARN
#endif

#if TANDEM_LOG_LEVEL >= TANDEM_LOG_LEVEL_ERROR
#define TANDEM_ERROR(...)                                                      \
  do {                                                                         \
    tandem::json::log::output_log_header(TANDEM_LOG_DEFAULT_STREAM,            \
                                         TANDEM_LOG_LEVEL_ERROR);              \
    std::fprintf(TANDEM_LOG_DEFAULT_STREAM, __VA_ARGS__);                      \
    std::fflush(TANDEM_LOG_DEFAULT_STREAM);                                    \
  } while (0)
#else
#define TANDEM_ERROR(...) ((void)0)
#endif

#if TANDEM_LOG_LEVEL >= TANDEM_LOG_LEVEL_WARN
#define TANDEM_WARN(...)                                                       \
  do {                                                                         \
    tandem::json::log::output_log_header(TANDEM_LOG_DEFAULT_STREAM,            \
                                         TANDEM_LOG_LEVEL_WARN);               \
    std::fprintf(TANDEM_LOG_DEFAULT_STREAM, __VA_ARGS__);                      \
    std::fflush(TANDEM_LOG_DEFAULT_STREAM);                                    \
  } while (0)
#else
#define TANDEM_WARN(...) ((void)0)
#endif

#if TANDEM_LOG_LEVEL >= TANDEM_LOG_LEVEL_INFO
#define TANDEM_INFO(...)                                                       \
  do {                                                                         \
    tandem::json::log::output_log_header(TANDEM_LOG_DEFAULT_STREAM,            \
                                         TANDEM_LOG_LEVEL_INFO);               \
    std::fprintf(TANDEM_LOG_DEFAULT_STREAM, __VA_ARGS__);                      \
    std::fflush(TANDEM_LOG_DEFAULT_STREAM);                                    \
  } while (0)
#else
#define TANDEM_INFO(...) ((void)0)
#endif

#if TANDEM_LOG_LEVEL >= TANDEM_LOG_LEVEL_TRACE
#define TANDEM_TRACE(...)                                                      \
  do {                                                                         \
    tandem::json::log::output_log_header(TANDEM_LOG_DEFAULT_STREAM,            \
                                         TANDEM_LOG_LEVEL_TRACE);              \
    std::fprintf(TANDEM_LOG_DEFAULT_STREAM, __VA_ARGS__);                      \
    std::fflush(TANDEM_LOG_DEFAULT_STREAM);                                    \
  } while (0)
#else
#define TANDEM_TRACE(...) ((void)0)
#endif

namespace tandem {
namespace json {
namespace log {

/// Return decent-precision time formatted as seconds:microseconds
inline std::string get_formatted_time() {
  const auto now = std::chrono::system_clock::now();

  const size_t sec = static_cast<size_t>(
      std::chrono::time_point_cast<std::chrono::seconds>(now)
          .time_since_epoch()
          .count());

  const size_t usec = static_cast<size_t>(
      std::chrono::time_point_cast<std::chrono::microseconds>(now)
          .time_since_epoch()
          .count());

  // Roll-over seconds every 100 seconds
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%zu:%06zu", sec % 100,
                usec - (sec * 1000000));
  return std::string(buf);
}

inline void output_log_header(FILE *stream, int level) {
  std::string formatted_time = get_formatted_time();

  const char *type;
  switch (level) {
  case TANDEM_LOG_LEVEL_ERROR:
    type = "ERROR";
    break;
  case TANDEM_LOG_LEVEL_WARN:
    type = "WARNG";
    break;
  case TANDEM_LOG_LEVEL_INFO:
    type = "INFOR";
    break;
  case TANDEM_LOG_LEVEL_TRACE:
    type = "TRACE";
    break;
  default:
    type = "UNKWN";
  }

  std::fprintf(stream, "%s %s: ", formatted_time.c_str(), type);
}

} // namespace log
} // namespace json
} // namespace tandem

#endif // TANDEM_JSON_LOG_HPP
