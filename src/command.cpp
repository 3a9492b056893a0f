// -----------------------------------------------------------------------------
// command.cpp: Command factories, reply grammars and argument validation
//
// API & field descriptions:
//   see include/rn2xx3/command.hpp
//
// The factories never fail. Anything wrong with the arguments (a key of the
// wrong length, a port of 0) is carried inside the Command and rejected later
// by validate(), so the engine has one place to refuse a command from.
// -----------------------------------------------------------------------------
#include "rn2xx3/command.hpp"

namespace rn2xx3 {

namespace {

Command make(Command::Kind k) {
  Command c;
  c.kind = k;
  return c;
}

bool has_len(const Command& c, size_t n) {
  return !c.oversized && c.data.size() == n;
}

ReplyShape shape(ShapeKind k, uint8_t hex_len = 0, uint32_t max = 0) {
  ReplyShape s;
  s.kind    = k;
  s.hex_len = hex_len;
  s.max     = max;
  return s;
}

} // namespace

// ---------- factories: private ----------

Command Command::with_bytes(Kind k, const uint8_t* p, size_t len) {
  Command c = make(k);
  if (len > c.data.max_size()) {          // keep the flag, drop the bytes
    c.oversized = true;
    return c;
  }
  if (p) c.data.assign(p, p + len);
  else if (len > 0) c.oversized = true;   // length without data is unusable
  return c;
}

// ---------- factories: sys ----------

Command Command::reset()         { return make(Kind::Reset); }
Command Command::factory_reset() { return make(Kind::FactoryReset); }
Command Command::get_version()   { return make(Kind::GetVersion); }
Command Command::get_hweui()     { return make(Kind::GetHwEui); }
Command Command::get_vdd()       { return make(Kind::GetVdd); }

Command Command::nvm_set(uint16_t addr, uint8_t byte) {
  Command c = make(Kind::NvmSet);
  c.address = addr;
  c.value   = byte;
  return c;
}

Command Command::nvm_get(uint16_t addr) {
  Command c = make(Kind::NvmGet);
  c.address = addr;
  return c;
}

Command Command::sleep(uint32_t millis) {
  Command c = make(Kind::Sleep);
  c.number = millis;
  return c;
}

// ---------- factories: mac ----------

Command Command::save_config()  { return make(Kind::SaveConfig); }

Command Command::set_dev_addr(const uint8_t* addr, size_t len) { return with_bytes(Kind::SetDevAddr, addr, len); }
Command Command::get_dev_addr() { return make(Kind::GetDevAddr); }
Command Command::set_dev_eui(const uint8_t* eui, size_t len)   { return with_bytes(Kind::SetDevEui, eui, len); }
Command Command::get_dev_eui()  { return make(Kind::GetDevEui); }
Command Command::set_app_eui(const uint8_t* eui, size_t len)   { return with_bytes(Kind::SetAppEui, eui, len); }
Command Command::get_app_eui()  { return make(Kind::GetAppEui); }

Command Command::set_network_session_key(const uint8_t* key, size_t len) {
  return with_bytes(Kind::SetNwkSKey, key, len);
}
Command Command::set_app_session_key(const uint8_t* key, size_t len) {
  return with_bytes(Kind::SetAppSKey, key, len);
}
Command Command::set_app_key(const uint8_t* key, size_t len) {
  return with_bytes(Kind::SetAppKey, key, len);
}

Command Command::set_adr(bool enabled) {
  Command c = make(Kind::SetAdr);
  c.enabled = enabled;
  return c;
}
Command Command::get_adr() { return make(Kind::GetAdr); }

Command Command::set_up_counter(uint32_t counter) {
  Command c = make(Kind::SetUpCounter);
  c.number = counter;
  return c;
}
Command Command::get_up_counter() { return make(Kind::GetUpCounter); }

Command Command::set_down_counter(uint32_t counter) {
  Command c = make(Kind::SetDownCounter);
  c.number = counter;
  return c;
}
Command Command::get_down_counter() { return make(Kind::GetDownCounter); }

Command Command::set_data_rate(uint8_t index) {
  Command c = make(Kind::SetDataRate);
  c.data_rate = index;
  return c;
}
Command Command::get_data_rate(uint8_t highest) {
  Command c = make(Kind::GetDataRate);
  c.data_rate = highest;
  return c;
}

Command Command::join(JoinMode mode) {
  Command c = make(Kind::Join);
  c.join_mode = mode;
  return c;
}

Command Command::transmit(ConfirmationMode mode, uint8_t port, const uint8_t* payload, size_t len) {
  Command c = with_bytes(Kind::Transmit, payload, len);
  c.confirm = mode;
  c.port    = port;
  return c;
}

Command Command::sync() { return make(Kind::Sync); }

// ---------- reply grammar ----------

ReplyShape reply_shape(const Command& cmd) {
  using K = Command::Kind;
  switch (cmd.kind) {
    case K::Reset:
    case K::FactoryReset:
    case K::GetVersion:     return shape(ShapeKind::Version);
    case K::GetHwEui:       return shape(ShapeKind::Hex, EUI_LEN);
    case K::GetVdd:         return shape(ShapeKind::Decimal, 0, 0xFFFF);        // millivolts
    case K::NvmGet:         return shape(ShapeKind::Hex, 1);
    case K::Sleep:          return shape(ShapeKind::None);                      // answers on wake-up
    case K::GetDevAddr:     return shape(ShapeKind::Hex, DEV_ADDR_LEN);
    case K::GetDevEui:
    case K::GetAppEui:      return shape(ShapeKind::Hex, EUI_LEN);
    case K::GetAdr:         return shape(ShapeKind::OnOff);
    case K::GetUpCounter:
    case K::GetDownCounter: return shape(ShapeKind::Decimal, 0, 0xFFFFFFFFu);
    case K::GetDataRate:    return shape(ShapeKind::Decimal, 0, cmd.data_rate);
    case K::Join:           return shape(ShapeKind::Join);
    case K::Transmit:       return shape(ShapeKind::Transmit);
    case K::Sync:           return shape(ShapeKind::Sync);
    case K::NvmSet:
    case K::SaveConfig:
    case K::SetDevAddr:
    case K::SetDevEui:
    case K::SetAppEui:
    case K::SetNwkSKey:
    case K::SetAppSKey:
    case K::SetAppKey:
    case K::SetAdr:
    case K::SetUpCounter:
    case K::SetDownCounter:
    case K::SetDataRate:    return shape(ShapeKind::Ok);
  }
  return shape(ShapeKind::Ok);
}

// ---------- validation ----------

DriverError validate(const Command& cmd) {
  using K = Command::Kind;
  const DriverError bad = DriverError::of(ErrorKind::BadParameter);

  switch (cmd.kind) {
    case K::NvmSet:
    case K::NvmGet:
      if (cmd.address < NVM_ADDR_MIN || cmd.address > NVM_ADDR_MAX) return bad;
      break;

    case K::Sleep:
      if (cmd.number < SLEEP_MS_MIN) return bad;   // upper bound is the type's
      break;

    case K::SetDevAddr:
      if (!has_len(cmd, DEV_ADDR_LEN)) return bad;
      break;

    case K::SetDevEui:
    case K::SetAppEui:
      if (!has_len(cmd, EUI_LEN)) return bad;
      break;

    case K::SetNwkSKey:
    case K::SetAppSKey:
    case K::SetAppKey:
      if (!has_len(cmd, KEY_LEN)) return bad;
      break;

    case K::Transmit:
      if (cmd.oversized) return bad;
      if (cmd.port < PORT_MIN || cmd.port > PORT_MAX) return bad;
      break;

    default:
      break;                              // no arguments, or any value is legal
  }
  return DriverError::none();
}

const char* to_string(Command::Kind kind) {
  using K = Command::Kind;
  switch (kind) {
    case K::Reset:          return "reset";
    case K::FactoryReset:   return "factory_reset";
    case K::GetVersion:     return "get_version";
    case K::GetHwEui:       return "get_hweui";
    case K::GetVdd:         return "get_vdd";
    case K::NvmSet:         return "nvm_set";
    case K::NvmGet:         return "nvm_get";
    case K::Sleep:          return "sleep";
    case K::SaveConfig:     return "save_config";
    case K::SetDevAddr:     return "set_dev_addr";
    case K::GetDevAddr:     return "get_dev_addr";
    case K::SetDevEui:      return "set_dev_eui";
    case K::GetDevEui:      return "get_dev_eui";
    case K::SetAppEui:      return "set_app_eui";
    case K::GetAppEui:      return "get_app_eui";
    case K::SetNwkSKey:     return "set_nwkskey";
    case K::SetAppSKey:     return "set_appskey";
    case K::SetAppKey:      return "set_appkey";
    case K::SetAdr:         return "set_adr";
    case K::GetAdr:         return "get_adr";
    case K::SetUpCounter:   return "set_upctr";
    case K::GetUpCounter:   return "get_upctr";
    case K::SetDownCounter: return "set_dnctr";
    case K::GetDownCounter: return "get_dnctr";
    case K::SetDataRate:    return "set_dr";
    case K::GetDataRate:    return "get_dr";
    case K::Join:           return "join";
    case K::Transmit:       return "transmit";
    case K::Sync:           return "sync";
  }
  return "unknown";
}

} // namespace rn2xx3
