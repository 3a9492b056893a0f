// -----------------------------------------------------------------------------
// errors.cpp: error taxonomy helpers
//
// Token table and names for logs. The table is the single place where the
// module's textual error replies are known; parser and engine both use it.
// -----------------------------------------------------------------------------
#include "rn2xx3/errors.hpp"
#include <string.h>

namespace rn2xx3 {

namespace {

struct TokenEntry {
  const char* token;
  ModuleError code;
};

// "denied" is deliberately absent: it is a join verdict, and only the parser
// knows whether a join acknowledgement is expected.
const TokenEntry TOKENS[] = {
  { "invalid_param",                   ModuleError::InvalidParam },
  { "keys_not_init",                   ModuleError::KeysNotInit },
  { "no_free_ch",                      ModuleError::NoFreeChannel },
  { "silent",                          ModuleError::Silent },
  { "busy",                            ModuleError::Busy },
  { "mac_paused",                      ModuleError::MacPaused },
  { "not_joined",                      ModuleError::NotJoined },
  { "frame_counter_err_rejoin_needed", ModuleError::FrameCounterRollover },
  { "invalid_data_len",                ModuleError::InvalidDataLength },
};

} // namespace

bool DriverError::retryable() const {
  switch (kind) {
    case ErrorKind::Timeout:
    case ErrorKind::TransportError:
    case ErrorKind::Busy:
      return true;
    case ErrorKind::ModuleReportedError:
      return module == ModuleError::Busy
          || module == ModuleError::NoFreeChannel
          || module == ModuleError::Silent
          || module == ModuleError::MacPaused;
    default:
      return false;
  }
}

ModuleError module_error_from_token(const etl::istring& line) {
  for (const auto& e : TOKENS) {
    const size_t n = strlen(e.token);
    if (line.size() == n && memcmp(line.data(), e.token, n) == 0) return e.code;
  }
  return ModuleError::None;
}

const char* to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None:                return "none";
    case ErrorKind::TransportError:      return "transport_error";
    case ErrorKind::Timeout:             return "timeout";
    case ErrorKind::ModuleReportedError: return "module_error";
    case ErrorKind::UnexpectedReply:     return "unexpected_reply";
    case ErrorKind::BufferOverflow:      return "buffer_overflow";
    case ErrorKind::Busy:                return "busy";
    case ErrorKind::BadParameter:        return "bad_parameter";
    case ErrorKind::SleepMode:           return "sleep_mode";
    case ErrorKind::NoCommand:           return "no_command";
  }
  return "unknown";
}

const char* to_string(ModuleError code) {
  if (code == ModuleError::None)   return "none";
  if (code == ModuleError::Denied) return "denied";
  for (const auto& e : TOKENS) {
    if (e.code == code) return e.token;
  }
  return "unknown";
}

} // namespace rn2xx3
