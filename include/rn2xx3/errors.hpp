/**
 * @file errors.hpp
 * @brief Error taxonomy shared by every layer of the driver and handed to callers unmodified.
 *
 * Nothing in the core throws. Every failure is a `DriverError` value that says which
 * layer gave up and, when the module itself refused a command, exactly which token it
 * answered with. The token is kept verbatim so it can be looked up in the Microchip
 * command reference.
 *
 * | Kind                | Raised when                                                     |
 * |---------------------|-----------------------------------------------------------------|
 * | TransportError      | the byte transport reported a read or write failure            |
 * | Timeout             | the poll budget ran out before the reply arrived                |
 * | ModuleReportedError | the module answered with one of its error tokens                |
 * | UnexpectedReply     | the reply matched no grammar expected for the command           |
 * | BufferOverflow      | a command or reply line did not fit its fixed buffer            |
 * | Busy                | another command is still outstanding                            |
 * | BadParameter        | argument validation failed; nothing was sent                    |
 * | SleepMode           | the module was put to sleep and has not reported wake-up        |
 * | NoCommand           | poll() was called with nothing outstanding                      |
 *
 * After any error the driver is back in Idle and accepts the next command.
 */
#pragma once

#include "etl/string.h"
#include <stdint.h>

namespace rn2xx3 {

enum class ErrorKind : uint8_t {
  None = 0,
  TransportError,
  Timeout,
  ModuleReportedError,
  UnexpectedReply,
  BufferOverflow,
  Busy,
  BadParameter,
  SleepMode,
  NoCommand
};

/// Error tokens the module answers with, as documented in the RN2483/RN2903 command reference.
enum class ModuleError : uint8_t {
  None = 0,
  InvalidParam,          ///< invalid_param
  KeysNotInit,           ///< keys_not_init
  NoFreeChannel,         ///< no_free_ch
  Silent,                ///< silent
  Busy,                  ///< busy
  MacPaused,             ///< mac_paused
  Denied,                ///< denied
  NotJoined,             ///< not_joined
  FrameCounterRollover,  ///< frame_counter_err_rejoin_needed
  InvalidDataLength      ///< invalid_data_len
};

/// Verbatim copy of the token the module sent.
using ErrorToken = etl::string<32>;

struct DriverError {
  ErrorKind   kind   = ErrorKind::None;
  ModuleError module = ModuleError::None;  ///< Set only for ModuleReportedError
  ErrorToken  token;                       ///< Module token, verbatim

  bool ok() const { return kind == ErrorKind::None; }

  /**
   * @brief Whether retrying the same command later can reasonably succeed.
   *
   * Timeouts, transport hiccups, a busy driver, and the module's transient
   * refusals (busy, no free channel, silent, paused MAC) qualify. Parameter
   * errors and protocol violations do not.
   */
  bool retryable() const;

  static DriverError none() { return DriverError{}; }
  static DriverError of(ErrorKind k) {
    DriverError e;
    e.kind = k;
    return e;
  }
  static DriverError module_error(ModuleError code, const etl::istring& raw) {
    DriverError e;
    e.kind   = ErrorKind::ModuleReportedError;
    e.module = code;
    e.token.assign(raw.begin(), raw.end());
    return e;
  }
};

const char* to_string(ErrorKind kind);
const char* to_string(ModuleError code);

/**
 * @brief Map a module reply to a known error token.
 * @return ModuleError::None if @p line is not an error token.
 */
ModuleError module_error_from_token(const etl::istring& line);

} // namespace rn2xx3
