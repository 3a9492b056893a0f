// -----------------------------------------------------------------------------
// encoder.cpp: Command → ASCII wire line
//
// Each branch appends the verb, then its arguments, then CRLF. The helpers all
// refuse to write past the buffer; the first refusal aborts the whole line and
// the output is cleared, so callers never see a truncated command.
// -----------------------------------------------------------------------------
#include "rn2xx3/encoder.hpp"
#include "rn2xx3/hex.hpp"

namespace rn2xx3 {

namespace {

// Verb + space + hex payload, e.g. "mac set deveui 0004a30b001a55ed".
bool put_hex_arg(etl::istring& out, const char* verb, const Bytes& data) {
  return hex::append_str(out, verb)
      && hex::append_bytes(out, data.data(), data.size());
}

bool put_decimal_arg(etl::istring& out, const char* verb, uint32_t value) {
  return hex::append_str(out, verb)
      && hex::append_decimal(out, value);
}

bool put_body(const Command& cmd, etl::istring& out) {
  using K = Command::Kind;
  switch (cmd.kind) {
    // ---- sys ----
    case K::Reset:        return hex::append_str(out, "sys reset");
    case K::FactoryReset: return hex::append_str(out, "sys factoryRESET");
    case K::GetVersion:   return hex::append_str(out, "sys get ver");
    case K::GetHwEui:     return hex::append_str(out, "sys get hweui");
    case K::GetVdd:       return hex::append_str(out, "sys get vdd");

    case K::NvmSet:                              // address trimmed, byte always two digits
      return hex::append_str(out, "sys set nvm ")
          && hex::append_trimmed(out, cmd.address)
          && hex::append_str(out, " ")
          && hex::append_byte(out, cmd.value);

    case K::NvmGet:
      return hex::append_str(out, "sys get nvm ")
          && hex::append_trimmed(out, cmd.address);

    case K::Sleep:        return put_decimal_arg(out, "sys sleep ", cmd.number);

    // ---- mac ----
    case K::SaveConfig:   return hex::append_str(out, "mac save");
    case K::SetDevAddr:   return put_hex_arg(out, "mac set devaddr ", cmd.data);
    case K::GetDevAddr:   return hex::append_str(out, "mac get devaddr");
    case K::SetDevEui:    return put_hex_arg(out, "mac set deveui ", cmd.data);
    case K::GetDevEui:    return hex::append_str(out, "mac get deveui");
    case K::SetAppEui:    return put_hex_arg(out, "mac set appeui ", cmd.data);
    case K::GetAppEui:    return hex::append_str(out, "mac get appeui");
    case K::SetNwkSKey:   return put_hex_arg(out, "mac set nwkskey ", cmd.data);
    case K::SetAppSKey:   return put_hex_arg(out, "mac set appskey ", cmd.data);
    case K::SetAppKey:    return put_hex_arg(out, "mac set appkey ", cmd.data);

    case K::SetAdr:
      return hex::append_str(out, cmd.enabled ? "mac set adr on" : "mac set adr off");
    case K::GetAdr:       return hex::append_str(out, "mac get adr");

    case K::SetUpCounter:   return put_decimal_arg(out, "mac set upctr ", cmd.number);
    case K::GetUpCounter:   return hex::append_str(out, "mac get upctr");
    case K::SetDownCounter: return put_decimal_arg(out, "mac set dnctr ", cmd.number);
    case K::GetDownCounter: return hex::append_str(out, "mac get dnctr");
    case K::SetDataRate:    return put_decimal_arg(out, "mac set dr ", cmd.data_rate);
    case K::GetDataRate:    return hex::append_str(out, "mac get dr");

    case K::Join:
      return hex::append_str(out, "mac join ")
          && hex::append_str(out, to_string(cmd.join_mode));

    case K::Transmit:                            // "mac tx <cnf|uncnf> <port> <hex>"
      return hex::append_str(out, "mac tx ")
          && hex::append_str(out, to_string(cmd.confirm))
          && hex::append_str(out, " ")
          && hex::append_decimal(out, cmd.port)
          && hex::append_str(out, " ")
          && hex::append_bytes(out, cmd.data.data(), cmd.data.size());

    case K::Sync:         return hex::append_str(out, "z");
  }
  return false;
}

} // namespace

bool encode(const Command& cmd, etl::istring& out) {
  out.clear();
  if (!put_body(cmd, out) || !hex::append_str(out, CRLF)) {
    out.clear();                                 // never leave a partial line
    return false;
  }
  return true;
}

} // namespace rn2xx3
