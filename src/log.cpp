#include "rn2xx3/log.hpp"
#include <stdio.h>

namespace rn2xx3 {

const char* to_string(LogLevel level) {
  switch (level) {
    case LogLevel::Trace: return "trace";
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
    case LogLevel::Off:   return "off";
  }
  return "unknown";
}

void Logger::logf(LogLevel level, const char* fmt, ...) const {
  if (!enabled(level)) return;            // skip formatting entirely
  va_list args;
  va_start(args, fmt);
  vlogf(level, fmt, args);
  va_end(args);
}

void Logger::vlogf(LogLevel level, const char* fmt, va_list args) const {
  if (!enabled(level) || !fmt) return;
  char buf[RN2XX3_LOG_LINE_MAX];
  const int n = vsnprintf(buf, sizeof(buf), fmt, args);
  if (n < 0) return;                      // encoding error, nothing to emit
  sink_->write(level, buf);               // clipped to the buffer by vsnprintf
}

} // namespace rn2xx3
