/**
 * @file types.hpp
 * @brief Shared vocabulary of the RN2xx3 driver: capacities, buffers, and the small enums
 *        every layer talks in.
 *
 * All storage here is fixed-capacity ETL so the same header builds for a bare-metal
 * MCU and for a Linux host without touching the heap.
 *
 * ## Tuning capacities
 * - `RN2XX3_LINE_MAX`     : longest reply line accepted from the module (terminator excluded).
 *                           The longest legitimate line is a downlink
 *                           `mac_rx <port> <hex>`, so keep it above `2 * RN2XX3_PAYLOAD_MAX + 11`.
 * - `RN2XX3_PAYLOAD_MAX`  : largest uplink/downlink application payload, in bytes.
 * - `RN2XX3_COMMAND_MAX`  : largest encoded command line including CRLF.
 * - `RN2XX3_EVENT_QUEUE`  : asynchronous events kept while a command is outstanding.
 *
 * Define any of these before including the driver headers (or via the build system)
 * to override the defaults.
 */
#pragma once

#include "etl/string.h"
#include "etl/vector.h"
#include <stdint.h>
#include <stddef.h>

#ifndef RN2XX3_PAYLOAD_MAX
#define RN2XX3_PAYLOAD_MAX 128
#endif

#ifndef RN2XX3_LINE_MAX
#define RN2XX3_LINE_MAX (2 * RN2XX3_PAYLOAD_MAX + 32)
#endif

#ifndef RN2XX3_COMMAND_MAX
#define RN2XX3_COMMAND_MAX (2 * RN2XX3_PAYLOAD_MAX + 32)
#endif

#ifndef RN2XX3_EVENT_QUEUE
#define RN2XX3_EVENT_QUEUE 4
#endif

namespace rn2xx3 {

static constexpr size_t REPLY_LINE_MAX    = RN2XX3_LINE_MAX;     ///< Reply line capacity
static constexpr size_t PAYLOAD_MAX = RN2XX3_PAYLOAD_MAX;  ///< Application payload capacity
static constexpr size_t COMMAND_MAX = RN2XX3_COMMAND_MAX;  ///< Encoded command capacity
static constexpr size_t EVENT_QUEUE = RN2XX3_EVENT_QUEUE;  ///< Pending event capacity

/// Sizes of the fixed-width identifiers and keys the module stores.
static constexpr size_t DEV_ADDR_LEN = 4;
static constexpr size_t EUI_LEN      = 8;
static constexpr size_t KEY_LEN      = 16;

/// Valid LoRaWAN application port range for uplinks and downlinks.
static constexpr uint8_t PORT_MIN = 1;
static constexpr uint8_t PORT_MAX = 223;

/// User area of the module's non-volatile memory.
static constexpr uint16_t NVM_ADDR_MIN = 0x300;
static constexpr uint16_t NVM_ADDR_MAX = 0x3FF;

/// Sleep duration limits accepted by `sys sleep`, in milliseconds.
static constexpr uint32_t SLEEP_MS_MIN = 100;
static constexpr uint32_t SLEEP_MS_MAX = 0xFFFFFFFFu;

/// One terminated reply line, terminator stripped.
using RawLine = etl::string<REPLY_LINE_MAX>;

/// An encoded command line, CRLF included.
using CommandLine = etl::string<COMMAND_MAX>;

/// Binary payloads (keys, EUIs, application data).
using Bytes = etl::vector<uint8_t, PAYLOAD_MAX>;

/// Free-form reply text such as the firmware version banner.
using Text = etl::string<REPLY_LINE_MAX>;

enum class Model : uint8_t {
  RN2483 = 0,
  RN2903 = 1
};

enum class JoinMode : uint8_t {
  Otaa = 0,
  Abp  = 1
};

enum class ConfirmationMode : uint8_t {
  Confirmed   = 0,
  Unconfirmed = 1
};

/// Data rates of the EU 868 / 433 MHz and CN frequency plans (`mac set dr 0..6`).
enum class DataRateEuCn : uint8_t {
  Sf12Bw125 = 0,
  Sf11Bw125 = 1,
  Sf10Bw125 = 2,
  Sf9Bw125  = 3,
  Sf8Bw125  = 4,
  Sf7Bw125  = 5,
  Sf7Bw250  = 6
};

/// Data rates of the US 915 MHz frequency plan (`mac set dr 0..4`).
enum class DataRateUs : uint8_t {
  Sf10Bw125 = 0,
  Sf9Bw125  = 1,
  Sf8Bw125  = 2,
  Sf7Bw125  = 3,
  Sf8Bw500  = 4
};

inline uint8_t to_index(DataRateEuCn dr) { return static_cast<uint8_t>(dr); }
inline uint8_t to_index(DataRateUs dr)   { return static_cast<uint8_t>(dr); }

/// @return false if @p index is not a data rate of the EU/CN plans.
inline bool data_rate_from_index(uint32_t index, DataRateEuCn& out) {
  if (index > static_cast<uint32_t>(DataRateEuCn::Sf7Bw250)) return false;
  out = static_cast<DataRateEuCn>(index);
  return true;
}

/// @return false if @p index is not a data rate of the US plan.
inline bool data_rate_from_index(uint32_t index, DataRateUs& out) {
  if (index > static_cast<uint32_t>(DataRateUs::Sf8Bw500)) return false;
  out = static_cast<DataRateUs>(index);
  return true;
}

/**
 * @brief Frequency plans. A Driver is bound to exactly one; the plan fixes which
 *        data-rate table `set_data_rate()` takes and `get_data_rate()` yields.
 */
struct Freq433 {
  using DataRate = DataRateEuCn;
  static constexpr DataRate DATA_RATE_MAX = DataRateEuCn::Sf7Bw250;
  static constexpr Model    MODEL         = Model::RN2483;
};

struct Freq868 {
  using DataRate = DataRateEuCn;
  static constexpr DataRate DATA_RATE_MAX = DataRateEuCn::Sf7Bw250;
  static constexpr Model    MODEL         = Model::RN2483;
};

struct Freq915 {
  using DataRate = DataRateUs;
  static constexpr DataRate DATA_RATE_MAX = DataRateUs::Sf8Bw500;
  static constexpr Model    MODEL         = Model::RN2903;
};

const char* to_string(Model m);
const char* to_string(JoinMode m);
const char* to_string(ConfirmationMode m);

/**
 * @brief Identify the module from its version banner, e.g.
 *        "RN2483 1.0.3 Mar 22 2017 06:00:42".
 * @return false if the banner names neither supported model.
 */
bool model_from_version(const etl::istring& version, Model& out);

} // namespace rn2xx3
