/**
 * @file reply.hpp
 * @brief Typed view of module replies: values, asynchronous events, and the line classifier.
 *
 * @details
 * Every line the module prints is exactly one of:
 *
 *   - an **acknowledgement** of the outstanding command, bare ("ok") or carrying data
 *     (a hex EUI, a decimal counter, "on"/"off", the version banner);
 *   - a **module error** token ("invalid_param", "not_joined", ...);
 *   - an **asynchronous event** that belongs to an earlier, two-phase command
 *     ("accepted"/"denied" after `mac join`, "mac_tx_ok"/"mac_err"/"mac_rx ..." after
 *     `mac tx`);
 *   - something else, which is **malformed** from the driver's point of view.
 *
 * `parse()` decides which, given the reply grammar of the command in flight
 * (or ShapeKind::None while idle). It is total: any byte sequence yields one Reply.
 *
 * @code
 *   rn2xx3::RawLine line = "HWEUI 0004A30B001C0530";
 *   rn2xx3::Reply r = rn2xx3::parse(line, rn2xx3::reply_shape(rn2xx3::Command::get_hweui()));
 *   // r.kind == Reply::Kind::Ok, r.value.kind == ValueKind::Bytes, 8 bytes
 * @endcode
 */
#pragma once

#include "rn2xx3/command.hpp"
#include "rn2xx3/errors.hpp"
#include "rn2xx3/types.hpp"
#include <stdint.h>

namespace rn2xx3 {

enum class ValueKind : uint8_t {
  None = 0,
  Bytes,
  Number,
  Flag,
  Text
};

/// Typed payload of an acknowledgement. Exactly the field named by `kind` is meaningful.
struct Value {
  ValueKind kind   = ValueKind::None;
  rn2xx3::Bytes bytes;
  uint32_t  number = 0;
  bool      flag   = false;
  Text      text;

  /// Copy out a fixed-size identifier (EUI, device address, NVM byte).
  /// @return false unless this holds exactly @p len bytes.
  bool copy_bytes(uint8_t* out, size_t len) const;
};

enum class EventKind : uint8_t {
  JoinAccepted = 0,  ///< "accepted"
  JoinDenied,        ///< "denied"
  TxOk,              ///< "mac_tx_ok"
  TxFailed,          ///< "mac_err"
  Downlink,          ///< "mac_rx <port> <hex>"
  Wakeup             ///< "ok" after sys sleep
};

struct Event {
  EventKind kind = EventKind::JoinAccepted;
  uint8_t   port = 0;   ///< Downlink only
  Bytes     data;       ///< Downlink only
};

/// ParsedReply: exactly one tag active.
struct Reply {
  enum class Kind : uint8_t { Ok = 0, Error, Event, Malformed };

  Kind        kind = Kind::Malformed;
  Value       value;                       ///< Kind::Ok
  ModuleError error = ModuleError::None;   ///< Kind::Error
  ErrorToken  token;                       ///< Kind::Error, verbatim
  rn2xx3::Event event;                     ///< Kind::Event
};

/**
 * @brief Classify one reply line.
 * @param line      Line with the terminator already stripped.
 * @param expected  Grammar of the outstanding command; ShapeKind::None while idle.
 */
Reply parse(const etl::istring& line, const ReplyShape& expected);

/// Match only the asynchronous event grammar. @return false if @p line is not an event.
bool parse_event(const etl::istring& line, Event& out);

const char* to_string(EventKind kind);

} // namespace rn2xx3
