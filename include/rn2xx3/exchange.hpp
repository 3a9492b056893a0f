/**
 * @file exchange.hpp
 * @brief The command/response engine: one half-duplex exchange at a time, driven by polls.
 *
 * @details
 * ## Operational model
 * ```
 *  caller                         Exchange                          transport
 *    │ submit(cmd) ──► validate ─► encode into tx buffer
 *    │                    state = Transmitting
 *    │ poll(out) ───────► push bytes ───────────────────────────► try_write_byte()
 *    │                    (stop on WouldBlock, resume next poll)
 *    │                    state = AwaitingReply
 *    │ poll(out) ───────► LineReader::poll_line() ◄────────────── try_read_byte()
 *    │                    parse(line, expected shape)
 *    │                      ├─ ack        → Ready(value)       → Idle
 *    │                      ├─ error      → Ready(module err)  → Idle
 *    │                      ├─ event      → queue, keep waiting
 *    │                      └─ malformed  → Ready(UnexpectedReply) → Idle
 *    │ poll_event(ev) ──► queued events first, then idle lines
 * ```
 *
 * - **At most one** command outstanding. A second submit() is refused with Busy and
 *   never disturbs the one in flight.
 * - **No blocking.** Each poll() does what the transport allows right now and returns
 *   Pending otherwise. The caller's loop is the scheduler.
 * - **Bounded waiting.** Every poll() of an outstanding command counts against
 *   `DriverConfig::max_polls`; past it the exchange ends with Timeout. There is no
 *   clock, only the count.
 * - **Two-phase commands.** `mac join` and `mac tx` complete on the immediate "ok".
 *   Their verdicts ("accepted", "mac_tx_ok", "mac_rx ...") arrive later as events.
 *
 * ## Failure model
 * Every failure ends the exchange, returns the engine to Idle and is reported exactly
 * once. Nothing is retried. A reply that arrives after a Timeout is seen as an idle
 * line by poll_event(), or as the reply to the next command; use Command::sync() with
 * flush_input() to get back to a known state after a timeout.
 *
 * ## Aborted transmissions
 * A Timeout or TransportError while Transmitting can leave a fragment such as
 * `sys g` on the module's input with no terminator. The engine remembers the
 * terminator it still owes. The next submit() sends it ahead of the new command, and
 * the module's answer to the fragment (normally `invalid_param`) is dropped before
 * the new command's reply is parsed.
 *
 * The engine does not own the transport; `Driver` does, and passes it into each call.
 */
#pragma once

#include "etl/deque.h"
#include "rn2xx3/command.hpp"
#include "rn2xx3/errors.hpp"
#include "rn2xx3/line_reader.hpp"
#include "rn2xx3/log.hpp"
#include "rn2xx3/reply.hpp"
#include "rn2xx3/transport/transport_base.hpp"
#include "rn2xx3/types.hpp"
#include <stdint.h>

namespace rn2xx3 {

struct DriverConfig {
  /**
   * @brief Poll budget per command.
   *
   * Counts poll() calls from the first one after submit() until the reply. The
   * wall-clock timeout is this times the caller's poll interval.
   */
  uint32_t max_polls  = 1000;

  /// Longest accepted reply line, in bytes. Clamped to REPLY_LINE_MAX.
  size_t   line_limit = REPLY_LINE_MAX;

  /// Diagnostic sink; nullptr disables logging.
  LogSink* log_sink   = nullptr;
  LogLevel log_level  = LogLevel::Info;
};

enum class PollStatus : uint8_t { Pending = 0, Ready };

enum class State : uint8_t {
  Idle = 0,
  Encoding,
  Transmitting,
  AwaitingReply,
  Parsing
};

const char* to_string(State s);

/// Result of one completed exchange.
struct Outcome {
  Command::Kind command = Command::Kind::Sync;
  DriverError   error;
  Value         value;

  bool ok() const { return error.ok(); }

  /// @return false unless the reply carried exactly @p len bytes.
  bool as_bytes(uint8_t* out, size_t len) const { return ok() && value.copy_bytes(out, len); }
  bool as_number(uint32_t& out) const;
  bool as_flag(bool& out) const;
  bool as_text(Text& out) const;
  bool as_model(Model& out) const;

  /// @return false unless the reply was an index of that plan's data-rate table.
  bool as_data_rate(DataRateEuCn& out) const;
  bool as_data_rate(DataRateUs& out) const;
};

class Exchange {
public:
  explicit Exchange(const DriverConfig& cfg = DriverConfig{});

  /**
   * @brief Start an exchange.
   * @return None when accepted; Busy, SleepMode, BadParameter or BufferOverflow when
   *         refused. A refused command leaves any outstanding exchange untouched.
   */
  DriverError submit(const Command& cmd);

  /**
   * @brief Advance the outstanding exchange by one cooperative step.
   * @return Pending while waiting; Ready once @p out holds the result.
   *         With nothing outstanding, Ready with NoCommand.
   */
  PollStatus poll(transport::ITransport& t, Outcome& out);

  /**
   * @brief Non-blocking event path.
   *
   * Returns queued events first. While idle it also reads the transport: events are
   * returned in @p out, module error tokens in @p err as ModuleReportedError, any
   * other line in @p err as UnexpectedReply. While a command is outstanding only the
   * queue is consulted.
   *
   * @return Pending if nothing arrived; Ready if either @p out or @p err was set
   *         (check err.ok()).
   */
  PollStatus poll_event(transport::ITransport& t, Event& out, DriverError& err);

  /**
   * @brief Discard every byte the transport has buffered, and any partial line.
   * @return Busy while a command is outstanding; TransportError if a read fails.
   */
  DriverError flush_input(transport::ITransport& t);

  /// Forget that the module was put to sleep (the wake-up "ok" was missed).
  void wake();

  /**
   * @brief Treat the module as asleep without having sent `sys sleep`.
   *
   * For a driver attached to a module that another owner put to sleep: the next idle
   * line is taken as its wake-up and `ok` is reported as a Wakeup event.
   * @return Busy while a command is outstanding.
   */
  DriverError expect_wakeup();

  State    state()          const { return state_; }
  bool     busy()           const { return state_ != State::Idle; }
  bool     sleeping()       const { return sleeping_; }
  uint32_t polls_used()     const { return polls_; }
  uint32_t completed()      const { return completed_; }
  uint32_t dropped_events() const { return dropped_; }
  size_t   queued_events()  const { return events_.size(); }
  bool     line_open()      const { return !owed_.empty(); }  ///< aborted fragment not yet terminated
  const DriverConfig& config() const { return cfg_; }

private:
  PollStatus finish(Outcome& out, const DriverError& err);
  PollStatus finish_ok(Outcome& out, const Value& value);
  PollStatus transmit_step(transport::ITransport& t, Outcome& out);
  PollStatus await_step(transport::ITransport& t, Outcome& out);
  void queue_event(const Event& ev);
  void abandon_transmit();
  bool drop_stale();

  DriverConfig  cfg_;
  Logger        log_;
  LineReader    reader_;
  etl::string<COMMAND_MAX + 2> tx_;      // owed terminator + command line
  size_t        tx_pos_    = 0;
  size_t        lead_      = 0;          // bytes of tx_ that close an aborted line
  etl::string<2> owed_;                  // terminator still owed to the module
  uint32_t      stale_     = 0;          // answers to aborted lines not yet seen
  Command::Kind current_   = Command::Kind::Sync;
  ReplyShape    expected_;
  State         state_     = State::Idle;
  uint32_t      polls_     = 0;
  bool          sleeping_  = false;
  RawLine       line_;
  etl::deque<Event, EVENT_QUEUE> events_;
  uint32_t      completed_ = 0;
  uint32_t      dropped_   = 0;
};

} // namespace rn2xx3
