// -----------------------------------------------------------------------------
// reply.cpp: Line classifier for module replies
//
// API & grammar:
//   see include/rn2xx3/reply.hpp
//
// Classification order is fixed:
//   1. acknowledgement grammar of the expected shape
//   2. module error token
//   3. asynchronous event
//   4. malformed
// Step 1 comes first because the sync probe expects "invalid_param", which
// would otherwise be taken for an error.
// -----------------------------------------------------------------------------
#include "rn2xx3/reply.hpp"
#include "rn2xx3/hex.hpp"
#include <string.h>

namespace rn2xx3 {

namespace {

bool equals(const etl::istring& line, const char* lit) {
  const size_t n = strlen(lit);
  return line.size() == n && memcmp(line.data(), lit, n) == 0;
}

bool starts_with(const etl::istring& line, const char* lit) {
  const size_t n = strlen(lit);
  return line.size() >= n && memcmp(line.data(), lit, n) == 0;
}

bool is_alpha(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

Reply ok_with(const Value& v) {
  Reply r;
  r.kind  = Reply::Kind::Ok;
  r.value = v;
  return r;
}

Reply ok_empty() {
  return ok_with(Value{});
}

// Exactly 2*n hex digits, optionally preceded by "<letters> " (e.g. "HWEUI ").
bool match_hex(const etl::istring& line, uint8_t n, Value& out) {
  const char* p   = line.data();
  size_t      len = line.size();

  const size_t want = static_cast<size_t>(n) * 2;
  if (len > want) {                              // maybe labelled
    const size_t label = len - want - 1;
    if (label == 0 || p[label] != ' ') return false;
    for (size_t i = 0; i < label; ++i) {
      if (!is_alpha(p[i])) return false;
    }
    p   += label + 1;
    len  = want;
  }
  if (len != want || want == 0 || n > out.bytes.max_size()) return false;

  uint8_t buf[255];
  if (!hex::decode(p, len, buf)) return false;

  out.kind = ValueKind::Bytes;
  out.bytes.assign(buf, buf + n);
  return true;
}

bool match_decimal(const etl::istring& line, uint32_t max, Value& out) {
  uint32_t v = 0;
  if (!hex::parse_decimal(line.data(), line.size(), v)) return false;
  if (v > max) return false;
  out.kind   = ValueKind::Number;
  out.number = v;
  return true;
}

bool match_ack(const etl::istring& line, const ReplyShape& expected, Value& out) {
  switch (expected.kind) {
    case ShapeKind::None:
      return false;                              // nothing is an acknowledgement

    case ShapeKind::Ok:
    case ShapeKind::Join:
    case ShapeKind::Transmit:
      return equals(line, "ok");

    case ShapeKind::Sync:
      return equals(line, "invalid_param");

    case ShapeKind::Version: {
      Model m;
      if (!model_from_version(line, m)) return false;
      out.kind = ValueKind::Text;
      out.text.assign(line.begin(), line.end());
      return true;
    }

    case ShapeKind::Hex:
      return match_hex(line, expected.hex_len, out);

    case ShapeKind::Decimal:
      return match_decimal(line, expected.max, out);

    case ShapeKind::OnOff:
      if (equals(line, "on"))  { out.kind = ValueKind::Flag; out.flag = true;  return true; }
      if (equals(line, "off")) { out.kind = ValueKind::Flag; out.flag = false; return true; }
      return false;
  }
  return false;
}

// "mac_rx <port> <hex>"
bool match_downlink(const etl::istring& line, Event& out) {
  static const char PREFIX[] = "mac_rx ";
  if (!starts_with(line, PREFIX)) return false;

  const char* p   = line.data() + (sizeof(PREFIX) - 1);
  const char* end = line.data() + line.size();

  const char* sp = p;
  while (sp < end && *sp != ' ') ++sp;
  if (sp == end) return false;                   // no data field

  uint32_t port = 0;
  if (!hex::parse_decimal(p, static_cast<size_t>(sp - p), port)) return false;
  if (port < PORT_MIN || port > PORT_MAX) return false;

  const char*  data = sp + 1;
  const size_t n    = static_cast<size_t>(end - data);
  if (n == 0 || n % 2 != 0 || n / 2 > PAYLOAD_MAX) return false;

  uint8_t buf[PAYLOAD_MAX];
  if (!hex::decode(data, n, buf)) return false;

  out.kind = EventKind::Downlink;
  out.port = static_cast<uint8_t>(port);
  out.data.assign(buf, buf + n / 2);
  return true;
}

} // namespace

bool Value::copy_bytes(uint8_t* out, size_t len) const {
  if (kind != ValueKind::Bytes || bytes.size() != len) return false;
  if (len > 0 && !out) return false;
  for (size_t i = 0; i < len; ++i) out[i] = bytes[i];
  return true;
}

bool parse_event(const etl::istring& line, Event& out) {
  Event ev;
  if      (equals(line, "accepted"))  ev.kind = EventKind::JoinAccepted;
  else if (equals(line, "denied"))    ev.kind = EventKind::JoinDenied;
  else if (equals(line, "mac_tx_ok")) ev.kind = EventKind::TxOk;
  else if (equals(line, "mac_err"))   ev.kind = EventKind::TxFailed;
  else if (!match_downlink(line, ev)) return false;

  out = ev;
  return true;
}

Reply parse(const etl::istring& line, const ReplyShape& expected) {
  // 1. acknowledgement
  Value v;
  if (match_ack(line, expected, v)) return ok_with(v);

  // 2. module error token
  ModuleError code = module_error_from_token(line);
  if (code == ModuleError::None
      && expected.kind == ShapeKind::Join
      && equals(line, "denied")) {
    code = ModuleError::Denied;                  // immediate refusal of mac join
  }
  if (code != ModuleError::None) {
    Reply r;
    r.kind  = Reply::Kind::Error;
    r.error = code;
    r.token.assign(line.begin(), line.end());
    return r;
  }

  // 3. asynchronous event
  Reply r;
  if (parse_event(line, r.event)) {
    r.kind = Reply::Kind::Event;
    return r;
  }

  // 4. nothing matched
  r.kind = Reply::Kind::Malformed;
  return r;
}

const char* to_string(EventKind kind) {
  switch (kind) {
    case EventKind::JoinAccepted: return "join_accepted";
    case EventKind::JoinDenied:   return "join_denied";
    case EventKind::TxOk:         return "tx_ok";
    case EventKind::TxFailed:     return "tx_failed";
    case EventKind::Downlink:     return "downlink";
    case EventKind::Wakeup:       return "wakeup";
  }
  return "unknown";
}

} // namespace rn2xx3
