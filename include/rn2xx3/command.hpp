/**
 * @file command.hpp
 * @brief The closed set of module commands as a tagged value, plus what each one expects back.
 *
 * @details
 * A `Command` is a kind tag and the handful of argument fields that kind uses.
 * Build them with the static factories (`Command::join(JoinMode::Otaa)`,
 * `Command::set_data_rate(3)`, ...) rather than filling fields by hand; the
 * factories are the only place where a kind is paired with its arguments.
 *
 * Each kind maps to exactly one wire encoding (see encoder.hpp) and exactly one
 * reply grammar (`reply_shape()`), so the parser always knows what an
 * acknowledgement for the outstanding command looks like.
 *
 * Commands are plain values: copy them, keep them in tables, rebuild them.
 * They hold no reference to a driver or a transport.
 */
#pragma once

#include "rn2xx3/errors.hpp"
#include "rn2xx3/types.hpp"
#include <stdint.h>
#include <stddef.h>

namespace rn2xx3 {

/// Grammar of the immediate reply a command expects.
enum class ShapeKind : uint8_t {
  None = 0,  ///< No reply at all (sys sleep answers only on wake-up)
  Ok,        ///< "ok"
  Join,      ///< "ok", or one of the join refusal tokens including "denied"
  Transmit,  ///< "ok", or one of the uplink refusal tokens
  Version,   ///< Version banner "RN2483 ..." / "RN2903 ..."
  Hex,       ///< Fixed number of hex-encoded bytes, optionally labelled
  Decimal,   ///< Unsigned decimal up to a maximum
  OnOff,     ///< "on" / "off"
  Sync       ///< "invalid_param" is the expected answer to the sync probe
};

struct ReplyShape {
  ShapeKind kind    = ShapeKind::None;
  uint8_t   hex_len = 0;  ///< Byte count for ShapeKind::Hex
  uint32_t  max     = 0;  ///< Upper bound for ShapeKind::Decimal
};

struct Command {
  enum class Kind : uint8_t {
    Reset = 0,
    FactoryReset,
    GetVersion,
    GetHwEui,
    GetVdd,
    NvmSet,
    NvmGet,
    Sleep,
    SaveConfig,
    SetDevAddr,
    GetDevAddr,
    SetDevEui,
    GetDevEui,
    SetAppEui,
    GetAppEui,
    SetNwkSKey,
    SetAppSKey,
    SetAppKey,
    SetAdr,
    GetAdr,
    SetUpCounter,
    GetUpCounter,
    SetDownCounter,
    GetDownCounter,
    SetDataRate,
    GetDataRate,
    Join,
    Transmit,
    Sync
  };

  Kind kind = Kind::Sync;

  uint16_t         address   = 0;   ///< NvmSet / NvmGet
  uint8_t          value     = 0;   ///< NvmSet byte
  uint32_t         number    = 0;   ///< Sleep ms, frame counters
  uint8_t          data_rate = 0;   ///< SetDataRate index; GetDataRate highest index accepted
  bool             enabled   = false;  ///< SetAdr
  JoinMode         join_mode = JoinMode::Otaa;
  ConfirmationMode confirm   = ConfirmationMode::Unconfirmed;
  uint8_t          port      = 0;   ///< Transmit
  Bytes            data;            ///< Keys, EUIs, device address, uplink payload
  bool             oversized = false;  ///< Factory was handed more bytes than Bytes holds

  // ---- sys ----
  static Command reset();
  static Command factory_reset();
  static Command get_version();
  static Command get_hweui();
  static Command get_vdd();
  static Command nvm_set(uint16_t addr, uint8_t byte);
  static Command nvm_get(uint16_t addr);
  static Command sleep(uint32_t millis);

  // ---- mac ----
  static Command save_config();
  static Command set_dev_addr(const uint8_t* addr, size_t len);
  static Command get_dev_addr();
  static Command set_dev_eui(const uint8_t* eui, size_t len);
  static Command get_dev_eui();
  static Command set_app_eui(const uint8_t* eui, size_t len);
  static Command get_app_eui();
  static Command set_network_session_key(const uint8_t* key, size_t len);
  static Command set_app_session_key(const uint8_t* key, size_t len);
  static Command set_app_key(const uint8_t* key, size_t len);
  static Command set_adr(bool enabled);
  static Command get_adr();
  static Command set_up_counter(uint32_t counter);
  static Command get_up_counter();
  static Command set_down_counter(uint32_t counter);
  static Command get_down_counter();
  static Command set_data_rate(uint8_t index);
  static Command set_data_rate(DataRateEuCn dr) { return set_data_rate(to_index(dr)); }
  static Command set_data_rate(DataRateUs dr) { return set_data_rate(to_index(dr)); }
  /// @param highest largest index the reply may carry; anything above is malformed.
  static Command get_data_rate(uint8_t highest = 0xFF);
  static Command join(JoinMode mode);
  static Command transmit(ConfirmationMode mode, uint8_t port, const uint8_t* payload, size_t len);

  /// "z" probe: a line the module can never accept, answered with invalid_param.
  static Command sync();

private:
  static Command with_bytes(Kind k, const uint8_t* p, size_t len);
};

/// Reply grammar of @p cmd.
ReplyShape reply_shape(const Command& cmd);

/**
 * @brief Check arguments before anything reaches the wire.
 *
 * Rejects with BadParameter: NVM address outside 0x300..0x3FF, sleep shorter than
 * 100 ms, port outside 1..223, key/EUI/address of the wrong length, payload larger
 * than the Bytes capacity.
 */
DriverError validate(const Command& cmd);

const char* to_string(Command::Kind kind);

} // namespace rn2xx3
