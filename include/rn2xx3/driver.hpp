/**
 * @file driver.hpp
 * @brief Public face of the library: a driver that owns one serial transport and exposes
 *        one typed operation per module command.
 *
 * @details
 * `Driver<Transport, Plan>` holds the transport by value for its whole lifetime. Nobody
 * else touches the port while the driver exists; `std::move(driver).destroy()` hands it
 * back. `Plan` is one of Freq433, Freq868 or Freq915 and picks the data-rate table:
 * an RN2483 driver cannot be handed a US data rate.
 *
 * Every typed operation (`hweui()`, `join()`, `set_data_rate()`, ...) only *submits* its
 * command and returns at once. The caller then keeps calling `poll()` from its own loop
 * until it reports Ready, and reads the typed result from the `Outcome`:
 *
 * @code
 *   rn2xx3::Rn2483_868<rn2xx3::transport::LinuxSerial> rn(std::move(serial));
 *
 *   if (!rn.hweui().ok()) { ... }               // refused: busy, asleep, bad args
 *   rn2xx3::Outcome out;
 *   while (rn.poll(out) == rn2xx3::PollStatus::Pending) {
 *     do_other_work();
 *   }
 *   uint8_t eui[8];
 *   if (out.as_bytes(eui, sizeof eui)) { ... }
 *
 *   // Later, unsolicited lines (join verdicts, downlinks):
 *   rn2xx3::Event ev; rn2xx3::DriverError err;
 *   if (rn.poll_event(ev, err) == rn2xx3::PollStatus::Ready && err.ok()) { ... }
 *
 *   auto serial_back = std::move(rn).destroy();
 * @endcode
 *
 * Transport is any movable type derived from `transport::ITransport`.
 */
#pragma once

#include "rn2xx3/command.hpp"
#include "rn2xx3/exchange.hpp"
#include "rn2xx3/transport/transport_base.hpp"
#include <type_traits>
#include <utility>

namespace rn2xx3 {

template <typename Transport, typename Plan>
class Driver {
  static_assert(std::is_base_of<transport::ITransport, Transport>::value,
                "Driver transport must implement rn2xx3::transport::ITransport");
  static_assert(std::is_move_constructible<Transport>::value,
                "Driver transport must be movable");

public:
  using DataRate = typename Plan::DataRate;

  explicit Driver(Transport transport, const DriverConfig& cfg = DriverConfig{})
  : transport_(std::move(transport)), exchange_(cfg) {}

  Driver(const Driver&) = delete;
  Driver& operator=(const Driver&) = delete;
  Driver(Driver&&) = default;
  Driver& operator=(Driver&&) = default;

  /// Tear down and return the transport. The driver is consumed.
  Transport destroy() && { return std::move(transport_); }

  // ---- generic exchange ----
  DriverError submit(const Command& cmd) { return exchange_.submit(cmd); }
  PollStatus  poll(Outcome& out) { return exchange_.poll(transport_, out); }
  PollStatus  poll_event(Event& out, DriverError& err) { return exchange_.poll_event(transport_, out, err); }
  DriverError flush_input() { return exchange_.flush_input(transport_); }
  void        wake() { exchange_.wake(); }
  DriverError expect_wakeup() { return exchange_.expect_wakeup(); }

  State    state()          const { return exchange_.state(); }
  bool     busy()           const { return exchange_.busy(); }
  bool     sleeping()       const { return exchange_.sleeping(); }
  bool     line_open()      const { return exchange_.line_open(); }
  uint32_t completed()      const { return exchange_.completed(); }
  uint32_t dropped_events() const { return exchange_.dropped_events(); }
  const DriverConfig& config() const { return exchange_.config(); }

  // ---- sys ----
  DriverError reset()                             { return submit(Command::reset()); }
  DriverError factory_reset()                     { return submit(Command::factory_reset()); }
  DriverError version()                           { return submit(Command::get_version()); }
  DriverError hweui()                             { return submit(Command::get_hweui()); }
  DriverError vdd()                               { return submit(Command::get_vdd()); }
  DriverError nvm_set(uint16_t addr, uint8_t b)   { return submit(Command::nvm_set(addr, b)); }
  DriverError nvm_get(uint16_t addr)              { return submit(Command::nvm_get(addr)); }
  DriverError sleep(uint32_t millis)              { return submit(Command::sleep(millis)); }
  DriverError sync()                              { return submit(Command::sync()); }

  // ---- mac ----
  DriverError save_config()                       { return submit(Command::save_config()); }
  DriverError set_dev_addr(const uint8_t* p, size_t n) { return submit(Command::set_dev_addr(p, n)); }
  DriverError get_dev_addr()                      { return submit(Command::get_dev_addr()); }
  DriverError set_dev_eui(const uint8_t* p, size_t n)  { return submit(Command::set_dev_eui(p, n)); }
  DriverError get_dev_eui()                       { return submit(Command::get_dev_eui()); }
  DriverError set_app_eui(const uint8_t* p, size_t n)  { return submit(Command::set_app_eui(p, n)); }
  DriverError get_app_eui()                       { return submit(Command::get_app_eui()); }
  DriverError set_network_session_key(const uint8_t* p, size_t n) {
    return submit(Command::set_network_session_key(p, n));
  }
  DriverError set_app_session_key(const uint8_t* p, size_t n) {
    return submit(Command::set_app_session_key(p, n));
  }
  DriverError set_app_key(const uint8_t* p, size_t n)  { return submit(Command::set_app_key(p, n)); }
  DriverError set_adr(bool enabled)               { return submit(Command::set_adr(enabled)); }
  DriverError get_adr()                           { return submit(Command::get_adr()); }
  DriverError set_up_counter(uint32_t c)          { return submit(Command::set_up_counter(c)); }
  DriverError get_up_counter()                    { return submit(Command::get_up_counter()); }
  DriverError set_down_counter(uint32_t c)        { return submit(Command::set_down_counter(c)); }
  DriverError get_down_counter()                  { return submit(Command::get_down_counter()); }
  DriverError set_data_rate(DataRate dr)          { return submit(Command::set_data_rate(dr)); }
  /// Reply is read with `Outcome::as_data_rate(DataRate&)`; indices outside the plan's
  /// table end the exchange with UnexpectedReply.
  DriverError get_data_rate() {
    return submit(Command::get_data_rate(to_index(Plan::DATA_RATE_MAX)));
  }
  DriverError join(JoinMode mode)                 { return submit(Command::join(mode)); }
  DriverError transmit(ConfirmationMode mode, uint8_t port, const uint8_t* data, size_t len) {
    return submit(Command::transmit(mode, port, data, len));
  }

private:
  Transport transport_;
  Exchange  exchange_;
};

template <typename Transport> using Rn2483_433 = Driver<Transport, Freq433>;
template <typename Transport> using Rn2483_868 = Driver<Transport, Freq868>;
template <typename Transport> using Rn2903_915 = Driver<Transport, Freq915>;

} // namespace rn2xx3
