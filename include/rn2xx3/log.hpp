/**
 * @file log.hpp
 * @brief Optional diagnostic logging: a sink interface the driver calls into, and a
 *        bounded printf-style front-end.
 *
 * The core never prints on its own. Hand it a `LogSink` through `DriverConfig` and it
 * traces commands sent, lines received, and errors. With no sink installed every call
 * is a cheap pointer check.
 *
 * Formatting goes into a fixed stack buffer of `RN2XX3_LOG_LINE_MAX` bytes; longer
 * messages are clipped, never allocated.
 */
#pragma once

#include <stdarg.h>
#include <stdint.h>

#ifndef RN2XX3_LOG_LINE_MAX
#define RN2XX3_LOG_LINE_MAX 160
#endif

namespace rn2xx3 {

enum class LogLevel : uint8_t { Trace = 0, Debug, Info, Warn, Error, Off };

const char* to_string(LogLevel level);

/// Destination for log lines. Implementations must not call back into the driver.
class LogSink {
public:
  virtual ~LogSink() = default;
  virtual void write(LogLevel level, const char* msg) = 0;
};

class Logger {
public:
  Logger() = default;
  Logger(LogSink* sink, LogLevel min_level) : sink_(sink), min_(min_level) {}

  bool enabled(LogLevel level) const {
    return sink_ != nullptr && level >= min_ && level != LogLevel::Off;
  }

#if defined(__GNUC__)
  __attribute__((format(printf, 3, 4)))
#endif
  void logf(LogLevel level, const char* fmt, ...) const;

  void vlogf(LogLevel level, const char* fmt, va_list args) const;

private:
  LogSink* sink_ = nullptr;
  LogLevel min_  = LogLevel::Info;
};

} // namespace rn2xx3
