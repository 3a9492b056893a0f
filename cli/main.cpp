/**
 * @file main.cpp
 * @brief rn2xx3-cli: Linux one-shot runner around rn2xx3::Driver.
 *
 * Responsibilities:
 *  - Parse global options and one subcommand (CLI11).
 *  - Merge defaults from $XDG_CONFIG_HOME/rn2xx3/config.json (nlohmann/json);
 *    anything given on the command line wins.
 *  - Open the serial port, hand it to the driver, spin poll()/poll_event()
 *    with a fixed sleep between polls, print key=value results.
 *
 * Exit codes:
 *   0 ok, 1 open/io failure, 2 usage or bad parameter, 3 timeout,
 *   4 module refused, 5 any other driver error.
 *
 * Notes:
 *  - Join and tx wait for the network verdict, not just the module's "ok".
 *  - Config file keys: dev, baud, plan, max_polls, poll_interval_us, app_eui, app_key.
 *  - --plan (433, 868, 915) picks the driver's frequency plan and with it the
 *    data-rate table `dr` accepts.
 */

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include <unistd.h> // usleep

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "rn2xx3/driver.hpp"
#include "rn2xx3/hex.hpp"
#include "rn2xx3/transport/transport_linux_serial.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace rn2xx3;

// ---------- exit codes ----------

enum Exit : int {
  RC_OK      = 0,
  RC_IO      = 1,
  RC_USAGE   = 2,
  RC_TIMEOUT = 3,
  RC_MODULE  = 4,
  RC_OTHER   = 5
};

// ---------- small utilities ----------

class StderrSink : public LogSink {
public:
  void write(LogLevel level, const char* msg) override {
    std::cerr << "level=" << to_string(level) << " msg=" << msg << "\n";
  }
};

struct Settings {
  std::string dev = "/dev/ttyUSB0";
  int baud = 57600;
  std::string plan = "868";
  uint32_t max_polls = 5000;
  uint32_t poll_interval_us = 1000;
  uint32_t event_timeout_ms = 20000;
  std::string app_eui;
  std::string app_key;
};

static fs::path default_config_path() {
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  const char* home = std::getenv("HOME");
  fs::path base = (xdg && *xdg) ? fs::path(xdg)
                                : fs::path(home ? home : ".") / ".config";
  return base / "rn2xx3" / "config.json";
}

// Missing file is fine; a broken one is reported and ignored.
static json read_json_file(const fs::path& p) {
  std::error_code ec;
  if (!fs::exists(p, ec)) return json::object();
  std::ifstream in(p);
  if (!in) return json::object();
  try {
    json j;
    in >> j;
    if (j.is_object()) return j;
    std::cerr << "level=warn msg=config " << p.string() << " is not an object\n";
  } catch (const json::exception& e) {
    std::cerr << "level=warn msg=config " << p.string() << " unreadable: " << e.what() << "\n";
  }
  return json::object();
}

template <typename T>
static void take(const json& j, const char* key, const CLI::Option* opt, T& dst) {
  if (opt && opt->count() > 0) return;          // command line wins
  auto it = j.find(key);
  if (it == j.end()) return;
  try {
    dst = it->get<T>();
  } catch (const json::exception&) {
    std::cerr << "level=warn msg=config key " << key << " has wrong type\n";
  }
}

static std::string hex_of(const uint8_t* p, size_t n) {
  Text t;
  if (!hex::append_bytes(t, p, n)) return {};
  return std::string(t.c_str());
}

static bool parse_hex_u16(const std::string& s, uint16_t& out) {
  const char* p = s.c_str();
  if (s.size() > 2 && p[0] == '0' && (p[1] == 'x' || p[1] == 'X')) p += 2;
  char* end = nullptr;
  unsigned long v = std::strtoul(p, &end, 16);
  if (!*p || *end || v > 0xFFFF) return false;
  out = static_cast<uint16_t>(v);
  return true;
}

static int exit_for(const DriverError& e) {
  switch (e.kind) {
    case ErrorKind::None:                return RC_OK;
    case ErrorKind::TransportError:      return RC_IO;
    case ErrorKind::BadParameter:        return RC_USAGE;
    case ErrorKind::Timeout:             return RC_TIMEOUT;
    case ErrorKind::ModuleReportedError: return RC_MODULE;
    default:                             return RC_OTHER;
  }
}

static int report(const char* op, const DriverError& e) {
  std::cerr << "status=error op=" << op << " reason=" << to_string(e.kind);
  if (e.kind == ErrorKind::ModuleReportedError) std::cerr << " token=" << e.token.c_str();
  std::cerr << "\n";
  return exit_for(e);
}

// ---------- poll loops ----------

template <typename Radio>
struct Session {
  Radio& rn;
  const Settings& s;

  // Spin one command to completion.
  bool run(const DriverError& submitted, Outcome& out) {
    if (!submitted.ok()) {
      out = Outcome{};
      out.error = submitted;
      return false;
    }
    while (rn.poll(out) == PollStatus::Pending) ::usleep(s.poll_interval_us);
    return out.ok();
  }

  // Wait for the next unsolicited event within extra_ms + event_timeout_ms.
  bool next_event(Event& ev, DriverError& err, uint64_t extra_ms = 0) {
    const uint64_t interval = s.poll_interval_us ? s.poll_interval_us : 1;
    const uint64_t budget = (extra_ms + s.event_timeout_ms) * 1000ull / interval + 1;
    for (uint64_t i = 0; i < budget; ++i) {
      if (rn.poll_event(ev, err) == PollStatus::Ready) return true;
      ::usleep(s.poll_interval_us);
    }
    err = DriverError::of(ErrorKind::Timeout);
    return false;
  }
};

// ---------- subcommands ----------

template <typename Radio>
static int cmd_info(Session<Radio>& ss, bool as_json) {
  Outcome out;
  if (!ss.run(ss.rn.reset(), out)) return report("reset", out.error);

  Text version;
  Model model = Model::RN2483;
  out.as_text(version);
  bool known = out.as_model(model);

  if (!ss.run(ss.rn.hweui(), out)) return report("hweui", out.error);
  uint8_t eui[EUI_LEN];
  out.as_bytes(eui, sizeof eui);

  if (!ss.run(ss.rn.vdd(), out)) return report("vdd", out.error);
  uint32_t vdd = 0;
  out.as_number(vdd);

  if (as_json) {
    json j;
    j["model"]   = known ? to_string(model) : "unknown";
    j["version"] = version.c_str();
    j["hweui"]   = hex_of(eui, sizeof eui);
    j["vdd_mv"]  = vdd;
    std::cout << j.dump(2) << "\n";
  } else {
    std::cout << "model=" << (known ? to_string(model) : "unknown")
              << " hweui=" << hex_of(eui, sizeof eui)
              << " vdd_mv=" << vdd
              << " version=\"" << version.c_str() << "\"\n";
  }
  return RC_OK;
}

template <typename Radio>
static int set_hex_param(Session<Radio>& ss, const char* op, const std::string& text, size_t want,
                         DriverError (Radio::*setter)(const uint8_t*, size_t)) {
  uint8_t buf[KEY_LEN];
  size_t n = 0;
  if (!hex::decode_str(text.c_str(), buf, sizeof buf, n) || n != want) {
    std::cerr << "status=error op=" << op << " reason=bad_hex\n";
    return RC_USAGE;
  }
  Outcome out;
  if (!ss.run((ss.rn.*setter)(buf, n), out)) return report(op, out.error);
  return RC_OK;
}

template <typename Radio>
static int cmd_join(Session<Radio>& ss, bool abp) {
  if (!ss.s.app_eui.empty()) {
    int rc = set_hex_param(ss, "set_appeui", ss.s.app_eui, EUI_LEN, &Radio::set_app_eui);
    if (rc != RC_OK) return rc;
  }
  if (!ss.s.app_key.empty()) {
    int rc = set_hex_param(ss, "set_appkey", ss.s.app_key, KEY_LEN, &Radio::set_app_key);
    if (rc != RC_OK) return rc;
  }

  Outcome out;
  if (!ss.run(ss.rn.join(abp ? JoinMode::Abp : JoinMode::Otaa), out)) return report("join", out.error);

  Event ev;
  DriverError err;
  while (ss.next_event(ev, err)) {
    if (!err.ok()) return report("join", err);
    if (ev.kind == EventKind::JoinAccepted) {
      std::cout << "status=ok joined=1 mode=" << (abp ? "abp" : "otaa") << "\n";
      return RC_OK;
    }
    if (ev.kind == EventKind::JoinDenied) {
      std::cerr << "status=error op=join reason=denied\n";
      return RC_MODULE;
    }
  }
  return report("join", err);
}

template <typename Radio>
static int cmd_tx(Session<Radio>& ss, int port, const std::string& data, bool confirmed) {
  uint8_t buf[PAYLOAD_MAX];
  size_t n = 0;
  if (!hex::decode_str(data.c_str(), buf, sizeof buf, n)) {
    std::cerr << "status=error op=tx reason=bad_hex\n";
    return RC_USAGE;
  }
  if (port < PORT_MIN || port > PORT_MAX) {
    std::cerr << "status=error op=tx reason=bad_port\n";
    return RC_USAGE;
  }

  Outcome out;
  const ConfirmationMode mode = confirmed ? ConfirmationMode::Confirmed : ConfirmationMode::Unconfirmed;
  if (!ss.run(ss.rn.transmit(mode, static_cast<uint8_t>(port), buf, n), out)) return report("tx", out.error);

  Event ev;
  DriverError err;
  while (ss.next_event(ev, err)) {
    if (!err.ok()) return report("tx", err);    // e.g. late invalid_data_len
    switch (ev.kind) {
      case EventKind::TxOk:
        std::cout << "status=ok sent=" << n << "\n";
        return RC_OK;
      case EventKind::Downlink:
        std::cout << "status=ok sent=" << n
                  << " downlink_port=" << static_cast<int>(ev.port)
                  << " downlink=" << hex_of(ev.data.data(), ev.data.size()) << "\n";
        return RC_OK;
      case EventKind::TxFailed:
        std::cerr << "status=error op=tx reason=mac_err\n";
        return RC_MODULE;
      default:
        break;                                  // unrelated verdict, keep waiting
    }
  }
  return report("tx", err);
}

template <typename Radio>
static int cmd_nvm_get(Session<Radio>& ss, const std::string& addr_s) {
  uint16_t addr = 0;
  if (!parse_hex_u16(addr_s, addr)) {
    std::cerr << "status=error op=nvm_get reason=bad_address\n";
    return RC_USAGE;
  }
  Outcome out;
  if (!ss.run(ss.rn.nvm_get(addr), out)) return report("nvm_get", out.error);
  uint8_t b = 0;
  out.as_bytes(&b, 1);
  std::cout << "addr=" << addr_s << " value=" << hex_of(&b, 1) << "\n";
  return RC_OK;
}

template <typename Radio>
static int cmd_nvm_set(Session<Radio>& ss, const std::string& addr_s, const std::string& byte_s) {
  uint16_t addr = 0, value = 0;
  if (!parse_hex_u16(addr_s, addr) || !parse_hex_u16(byte_s, value) || value > 0xFF) {
    std::cerr << "status=error op=nvm_set reason=bad_argument\n";
    return RC_USAGE;
  }
  Outcome out;
  if (!ss.run(ss.rn.nvm_set(addr, static_cast<uint8_t>(value)), out)) return report("nvm_set", out.error);
  std::cout << "status=ok\n";
  return RC_OK;
}

template <typename Radio>
static int cmd_sleep(Session<Radio>& ss, uint32_t ms) {
  Outcome out;
  if (!ss.run(ss.rn.sleep(ms), out)) return report("sleep", out.error);

  Event ev;
  DriverError err;
  if (!ss.next_event(ev, err, ms)) return report("sleep", err);
  if (!err.ok()) return report("sleep", err);
  if (ev.kind != EventKind::Wakeup) {
    std::cerr << "status=error op=sleep reason=unexpected_event event=" << to_string(ev.kind) << "\n";
    return RC_OTHER;
  }
  std::cout << "status=ok slept_ms=" << ms << "\n";
  return RC_OK;
}

// Module left asleep by an earlier run: wait for its wake-up "ok".
template <typename Radio>
static int cmd_wakeup(Session<Radio>& ss) {
  DriverError e = ss.rn.expect_wakeup();
  if (!e.ok()) return report("wakeup", e);

  Event ev;
  DriverError err;
  if (!ss.next_event(ev, err)) return report("wakeup", err);
  if (!err.ok()) return report("wakeup", err);
  std::cout << "status=ok awake=1\n";
  return RC_OK;
}

template <typename Radio>
static int cmd_adr(Session<Radio>& ss, const std::string& arg) {
  Outcome out;
  if (arg.empty()) {
    if (!ss.run(ss.rn.get_adr(), out)) return report("get_adr", out.error);
    bool on = false;
    out.as_flag(on);
    std::cout << "adr=" << (on ? "on" : "off") << "\n";
    return RC_OK;
  }
  if (arg != "on" && arg != "off") {
    std::cerr << "status=error op=set_adr reason=bad_argument\n";
    return RC_USAGE;
  }
  if (!ss.run(ss.rn.set_adr(arg == "on"), out)) return report("set_adr", out.error);
  std::cout << "status=ok adr=" << arg << "\n";
  return RC_OK;
}

template <typename Radio>
static int cmd_dr(Session<Radio>& ss, int index) {
  Outcome out;
  typename Radio::DataRate dr{};
  if (index < 0) {
    if (!ss.run(ss.rn.get_data_rate(), out)) return report("get_dr", out.error);
    out.as_data_rate(dr);
    std::cout << "dr=" << static_cast<int>(to_index(dr)) << "\n";
    return RC_OK;
  }
  if (!data_rate_from_index(static_cast<uint32_t>(index), dr)) {   // not in this plan's table
    std::cerr << "status=error op=set_dr reason=bad_data_rate plan=" << ss.s.plan << "\n";
    return RC_USAGE;
  }
  if (!ss.run(ss.rn.set_data_rate(dr), out)) return report("set_dr", out.error);
  std::cout << "status=ok dr=" << index << "\n";
  return RC_OK;
}

// Known state: drop whatever is buffered, then probe with "z".
template <typename Radio>
static int cmd_sync(Session<Radio>& ss) {
  DriverError fe = ss.rn.flush_input();
  if (!fe.ok()) return report("flush", fe);
  Outcome out;
  if (!ss.run(ss.rn.sync(), out)) return report("sync", out.error);
  std::cout << "status=ok synced=1\n";
  return RC_OK;
}

// ---------- main ----------

int main(int argc, char** argv) {
  Settings s;
  bool verbose = false;
  std::string config_path;

  CLI::App app{"RN2483/RN2903 LoRaWAN module tool"};
  app.require_subcommand(1);

  CLI::Option* opt_dev   = app.add_option("--dev", s.dev, "Serial device (e.g. /dev/serial/by-id/...)");
  CLI::Option* opt_baud  = app.add_option("--baud", s.baud, "Baud rate (default 57600)");
  CLI::Option* opt_plan  = app.add_option("--plan", s.plan, "Frequency plan: 433, 868 or 915 (default 868)")
                               ->check(CLI::IsMember({"433", "868", "915"}));
  CLI::Option* opt_polls = app.add_option("--max-polls", s.max_polls, "Poll budget per command");
  CLI::Option* opt_ival  = app.add_option("--poll-interval-us", s.poll_interval_us, "Sleep between polls (us)");
  app.add_option("--event-timeout-ms", s.event_timeout_ms, "How long to wait for join/tx verdicts (ms)");
  app.add_flag("-v,--verbose", verbose, "Log driver traffic to stderr");
  app.add_option("--config", config_path, "Config file (default $XDG_CONFIG_HOME/rn2xx3/config.json)");

  bool info_json = false;
  auto* sub_info = app.add_subcommand("info", "Reset module, print model, version, hweui, vdd");
  sub_info->add_flag("--json", info_json, "Print a JSON object");

  bool join_abp = false;
  auto* sub_join = app.add_subcommand("join", "Join the network and wait for the verdict");
  sub_join->add_flag("--abp", join_abp, "Activation by personalization (default OTAA)");
  CLI::Option* opt_eui = sub_join->add_option("--app-eui", s.app_eui, "AppEUI, 16 hex chars");
  CLI::Option* opt_key = sub_join->add_option("--app-key", s.app_key, "AppKey, 32 hex chars");

  int tx_port = 1;
  std::string tx_hex;
  bool tx_confirmed = false;
  auto* sub_tx = app.add_subcommand("tx", "Send an uplink and wait for the verdict");
  sub_tx->add_option("--port", tx_port, "Port 1..223")->required();
  sub_tx->add_option("--hex", tx_hex, "Payload as hex")->required();
  sub_tx->add_flag("--confirmed", tx_confirmed, "Confirmed uplink");

  std::string nvm_addr, nvm_byte;
  auto* sub_nvm_get = app.add_subcommand("nvm-get", "Read one byte of user NVM (0x300..0x3ff)");
  sub_nvm_get->add_option("ADDR", nvm_addr, "Address, hex")->required();
  auto* sub_nvm_set = app.add_subcommand("nvm-set", "Write one byte of user NVM (0x300..0x3ff)");
  sub_nvm_set->add_option("ADDR", nvm_addr, "Address, hex")->required();
  sub_nvm_set->add_option("BYTE", nvm_byte, "Value, hex")->required();

  uint32_t sleep_ms = 0;
  auto* sub_sleep = app.add_subcommand("sleep", "Put the module to sleep and wait for wake-up");
  sub_sleep->add_option("MS", sleep_ms, "Duration in ms (>= 100)")->required();

  auto* sub_wakeup = app.add_subcommand("wakeup", "Wait for a module that is still asleep to wake up");

  std::string adr_arg;
  auto* sub_adr = app.add_subcommand("adr", "Get or set adaptive data rate");
  sub_adr->add_option("STATE", adr_arg, "on|off (omit to read)");

  int dr_index = -1;
  auto* sub_dr = app.add_subcommand("dr", "Get or set the data rate index");
  sub_dr->add_option("INDEX", dr_index, "Data rate index (omit to read)");

  auto* sub_sync = app.add_subcommand("sync", "Flush input and bring the module to a known state");

  CLI11_PARSE(app, argc, argv);

  // -------- config file: fills only what the command line left unset --------
  const fs::path cfg_file = config_path.empty() ? default_config_path() : fs::path(config_path);
  const json cfg = read_json_file(cfg_file);
  take(cfg, "dev", opt_dev, s.dev);
  take(cfg, "baud", opt_baud, s.baud);
  take(cfg, "plan", opt_plan, s.plan);
  if (s.plan != "433" && s.plan != "868" && s.plan != "915") {
    std::cerr << "status=error reason=bad_plan plan=" << s.plan << "\n";
    return RC_USAGE;
  }
  take(cfg, "max_polls", opt_polls, s.max_polls);
  take(cfg, "poll_interval_us", opt_ival, s.poll_interval_us);
  take(cfg, "app_eui", opt_eui, s.app_eui);
  take(cfg, "app_key", opt_key, s.app_key);

  // -------- open port --------
  transport::LinuxSerial serial(s.dev, s.baud);
  if (!serial.begin()) {
    std::cerr << "status=error reason=open_failed dev=" << s.dev << "\n";
    return RC_IO;
  }

  StderrSink sink;
  DriverConfig dc;
  dc.max_polls = s.max_polls;
  dc.log_sink  = verbose ? &sink : nullptr;
  dc.log_level = LogLevel::Debug;

  // One driver type per plan; the subcommands are shared.
  auto run_plan = [&](auto plan) {
    Driver<transport::LinuxSerial, decltype(plan)> rn(std::move(serial), dc);
    Session<decltype(rn)> ss{rn, s};

    int rc = RC_OTHER;
    if      (*sub_info)    rc = cmd_info(ss, info_json);
    else if (*sub_join)    rc = cmd_join(ss, join_abp);
    else if (*sub_tx)      rc = cmd_tx(ss, tx_port, tx_hex, tx_confirmed);
    else if (*sub_nvm_get) rc = cmd_nvm_get(ss, nvm_addr);
    else if (*sub_nvm_set) rc = cmd_nvm_set(ss, nvm_addr, nvm_byte);
    else if (*sub_sleep)   rc = cmd_sleep(ss, sleep_ms);
    else if (*sub_wakeup)  rc = cmd_wakeup(ss);
    else if (*sub_adr)     rc = cmd_adr(ss, adr_arg);
    else if (*sub_dr)      rc = cmd_dr(ss, dr_index);
    else if (*sub_sync)    rc = cmd_sync(ss);

    transport::LinuxSerial port = std::move(rn).destroy();
    port.end();
    return rc;
  };

  if (s.plan == "433") return run_plan(Freq433{});
  if (s.plan == "915") return run_plan(Freq915{});
  return run_plan(Freq868{});
}
