// -----------------------------------------------------------------------------
// exchange.cpp: Implementation of the RN2xx3 command/response engine
//
// API & state diagram:
//   see include/rn2xx3/exchange.hpp
//
// Runnable scenarios:
//   see tests/test_driver.cpp
//
// NOTE: This file holds the policies of the engine: how a poll is counted,
// what ends an exchange, and where unsolicited lines go. Wire syntax lives
// in encoder.cpp, reply grammar in reply.cpp.
// -----------------------------------------------------------------------------
#include "rn2xx3/exchange.hpp"
#include "rn2xx3/encoder.hpp"

namespace rn2xx3 {

namespace {

// Upper bound on bytes discarded by one flush_input() call.
static constexpr uint32_t FLUSH_MAX_BYTES = 65535;

ReplyShape idle_shape() {
  return ReplyShape{};                   // ShapeKind::None: no ack expected
}

} // namespace

const char* to_string(State s) {
  switch (s) {
    case State::Idle:          return "idle";
    case State::Encoding:      return "encoding";
    case State::Transmitting:  return "transmitting";
    case State::AwaitingReply: return "awaiting_reply";
    case State::Parsing:       return "parsing";
  }
  return "unknown";
}

// ---------- Outcome ----------

bool Outcome::as_number(uint32_t& out) const {
  if (!ok() || value.kind != ValueKind::Number) return false;
  out = value.number;
  return true;
}

bool Outcome::as_flag(bool& out) const {
  if (!ok() || value.kind != ValueKind::Flag) return false;
  out = value.flag;
  return true;
}

bool Outcome::as_text(Text& out) const {
  if (!ok() || value.kind != ValueKind::Text) return false;
  out = value.text;
  return true;
}

bool Outcome::as_model(Model& out) const {
  if (!ok() || value.kind != ValueKind::Text) return false;
  return model_from_version(value.text, out);
}

bool Outcome::as_data_rate(DataRateEuCn& out) const {
  uint32_t index = 0;
  return as_number(index) && data_rate_from_index(index, out);
}

bool Outcome::as_data_rate(DataRateUs& out) const {
  uint32_t index = 0;
  return as_number(index) && data_rate_from_index(index, out);
}

// ---------- public ----------

Exchange::Exchange(const DriverConfig& cfg)
: cfg_(cfg),
  log_(cfg.log_sink, cfg.log_level),     // no sink: logging compiles to a pointer check
  reader_(cfg.line_limit) {}             // limit clamped by the reader itself

DriverError Exchange::submit(const Command& cmd) {
  if (state_ != State::Idle) {           // never touch the exchange in flight
    log_.logf(LogLevel::Debug, "refused %s: busy with %s",
              to_string(cmd.kind), to_string(current_));
    return DriverError::of(ErrorKind::Busy);
  }
  if (sleeping_) {                       // module would not hear us
    log_.logf(LogLevel::Debug, "refused %s: module asleep", to_string(cmd.kind));
    return DriverError::of(ErrorKind::SleepMode);
  }

  state_ = State::Encoding;

  const DriverError bad = validate(cmd);
  if (!bad.ok()) {
    state_ = State::Idle;                // nothing was sent
    log_.logf(LogLevel::Warn, "refused %s: bad parameter", to_string(cmd.kind));
    return bad;
  }

  CommandLine body;
  if (!encode(cmd, body)) {
    state_ = State::Idle;
    log_.logf(LogLevel::Warn, "refused %s: command does not fit", to_string(cmd.kind));
    return DriverError::of(ErrorKind::BufferOverflow);
  }

  if (!owed_.empty()) {                  // terminate the fragment an aborted send left behind
    log_.logf(LogLevel::Debug, "closing aborted line before %s", to_string(cmd.kind));
  }
  tx_.assign(owed_.data(), owed_.size());
  tx_.append(body.data(), body.size());
  lead_ = owed_.size();
  owed_.clear();

  current_  = cmd.kind;
  expected_ = reply_shape(cmd);
  tx_pos_   = 0;
  polls_    = 0;                         // budget starts with the first poll
  state_    = State::Transmitting;

  log_.logf(LogLevel::Debug, "send '%.*s'",
            static_cast<int>(body.size() >= 2 ? body.size() - 2 : body.size()), body.data());
  return DriverError::none();
}

PollStatus Exchange::poll(transport::ITransport& t, Outcome& out) {
  if (state_ == State::Idle) {           // nothing to advance
    out = Outcome{};
    out.command = current_;
    out.error   = DriverError::of(ErrorKind::NoCommand);
    return PollStatus::Ready;
  }

  ++polls_;
  if (polls_ > cfg_.max_polls) {         // budget spent: give up on this reply
    if (state_ == State::Transmitting) abandon_transmit();
    else stale_ = 0;                     // module is silent; nothing more is owed to us
    reader_.reset();                     // partial reply would poison the next one
    return finish(out, DriverError::of(ErrorKind::Timeout));
  }

  if (state_ == State::Transmitting) {
    const PollStatus ps = transmit_step(t, out);
    if (ps == PollStatus::Ready || state_ == State::Transmitting) return ps;
  }

  return await_step(t, out);             // same poll: the reply may already be there
}

PollStatus Exchange::poll_event(transport::ITransport& t, Event& out, DriverError& err) {
  err = DriverError::none();

  if (!events_.empty()) {                // queued during an exchange: oldest first
    out = events_.front();
    events_.pop_front();
    return PollStatus::Ready;
  }
  if (state_ != State::Idle) return PollStatus::Pending;  // lines belong to poll()

  for (;;) {
    const LineStatus ls = reader_.poll_line(t, line_);

    if (ls == LineStatus::Pending) return PollStatus::Pending;
    if (ls == LineStatus::Overflow) {
      err = DriverError::of(ErrorKind::BufferOverflow);
      log_.logf(LogLevel::Warn, "idle line too long, discarded");
      return PollStatus::Ready;
    }
    if (ls == LineStatus::TransportError) {
      err = DriverError::of(ErrorKind::TransportError);
      log_.logf(LogLevel::Warn, "transport %s: read failed", t.name());
      return PollStatus::Ready;
    }

    if (line_.empty()) continue;         // stray CRLF
    log_.logf(LogLevel::Debug, "recv '%s' (idle)", line_.c_str());
    if (drop_stale()) continue;

    if (sleeping_) {
      sleeping_ = false;                 // any line means the module is awake
      if (line_ == "ok") {
        out = Event{};
        out.kind = EventKind::Wakeup;
        log_.logf(LogLevel::Info, "module woke up");
        return PollStatus::Ready;
      }
      err = DriverError::of(ErrorKind::UnexpectedReply);
      return PollStatus::Ready;
    }

    const Reply r = parse(line_, idle_shape());
    switch (r.kind) {
      case Reply::Kind::Event:
        out = r.event;
        log_.logf(LogLevel::Info, "event %s", to_string(out.kind));
        return PollStatus::Ready;

      case Reply::Kind::Error:           // e.g. late invalid_data_len after mac tx
        err = DriverError::module_error(r.error, r.token);
        log_.logf(LogLevel::Warn, "module error '%s' while idle", r.token.c_str());
        return PollStatus::Ready;

      default:
        err = DriverError::of(ErrorKind::UnexpectedReply);
        log_.logf(LogLevel::Warn, "unexpected line '%s' while idle", line_.c_str());
        return PollStatus::Ready;
    }
  }
}

DriverError Exchange::flush_input(transport::ITransport& t) {
  if (state_ != State::Idle) return DriverError::of(ErrorKind::Busy);

  reader_.reset();                       // forget any partial line too
  uint32_t dropped = 0;
  while (dropped < FLUSH_MAX_BYTES) {
    uint8_t b = 0;
    const transport::ReadStatus rs = t.try_read_byte(b);
    if (rs == transport::ReadStatus::WouldBlock) break;
    if (rs == transport::ReadStatus::Error) {
      log_.logf(LogLevel::Warn, "transport %s: read failed during flush", t.name());
      return DriverError::of(ErrorKind::TransportError);
    }
    ++dropped;
  }
  if (dropped > 0) log_.logf(LogLevel::Debug, "flushed %u byte(s)", static_cast<unsigned>(dropped));
  return DriverError::none();
}

void Exchange::wake() {
  sleeping_ = false;                     // caller vouches the module is up
}

DriverError Exchange::expect_wakeup() {
  if (state_ != State::Idle) return DriverError::of(ErrorKind::Busy);
  sleeping_ = true;                      // next idle line is the wake-up
  log_.logf(LogLevel::Info, "waiting for wake-up");
  return DriverError::none();
}

// ---------- private ----------

// Push as many command bytes as the transport takes. Stays Transmitting on
// WouldBlock; moves to AwaitingReply (or completes sys sleep) once all are out.
PollStatus Exchange::transmit_step(transport::ITransport& t, Outcome& out) {
  while (tx_pos_ < tx_.size()) {
    const transport::WriteStatus ws = t.try_write_byte(static_cast<uint8_t>(tx_[tx_pos_]));
    if (ws == transport::WriteStatus::WouldBlock) return PollStatus::Pending;  // resume next poll
    if (ws == transport::WriteStatus::Error) {
      log_.logf(LogLevel::Warn, "transport %s: write failed", t.name());
      abandon_transmit();
      return finish(out, DriverError::of(ErrorKind::TransportError));
    }
    ++tx_pos_;
    if (lead_ > 0 && tx_pos_ == lead_) ++stale_;  // aborted line closed: module will answer it
  }

  if (expected_.kind == ShapeKind::None) { // sys sleep: module answers on wake-up
    sleeping_ = true;
    log_.logf(LogLevel::Info, "module sleeping");
    return finish_ok(out, Value{});
  }

  state_ = State::AwaitingReply;
  return PollStatus::Pending;
}

PollStatus Exchange::await_step(transport::ITransport& t, Outcome& out) {
  for (;;) {
    const LineStatus ls = reader_.poll_line(t, line_);

    if (ls == LineStatus::Pending) return PollStatus::Pending;
    if (ls == LineStatus::Overflow) {
      log_.logf(LogLevel::Warn, "reply to %s too long", to_string(current_));
      return finish(out, DriverError::of(ErrorKind::BufferOverflow));
    }
    if (ls == LineStatus::TransportError) {
      log_.logf(LogLevel::Warn, "transport %s: read failed", t.name());
      return finish(out, DriverError::of(ErrorKind::TransportError));
    }

    if (line_.empty()) continue;         // blank lines carry nothing
    log_.logf(LogLevel::Debug, "recv '%s'", line_.c_str());

    if (drop_stale()) continue;

    state_ = State::Parsing;
    const Reply r = parse(line_, expected_);
    switch (r.kind) {
      case Reply::Kind::Ok:
        return finish_ok(out, r.value);

      case Reply::Kind::Error:
        return finish(out, DriverError::module_error(r.error, r.token));

      case Reply::Kind::Event:           // verdict of an earlier join/tx
        queue_event(r.event);
        state_ = State::AwaitingReply;
        continue;                        // keep waiting for our own reply

      case Reply::Kind::Malformed:
        log_.logf(LogLevel::Warn, "unexpected reply '%s' to %s",
                  line_.c_str(), to_string(current_));
        return finish(out, DriverError::of(ErrorKind::UnexpectedReply));
    }
  }
}

PollStatus Exchange::finish(Outcome& out, const DriverError& err) {
  out = Outcome{};
  out.command = current_;
  out.error   = err;
  state_      = State::Idle;             // usable again after any error
  ++completed_;

  if (!err.ok()) {
    if (err.kind == ErrorKind::ModuleReportedError) {
      log_.logf(LogLevel::Warn, "%s failed: module answered '%s'",
                to_string(current_), err.token.c_str());
    } else {
      log_.logf(LogLevel::Warn, "%s failed: %s", to_string(current_), to_string(err.kind));
    }
  }
  return PollStatus::Ready;
}

PollStatus Exchange::finish_ok(Outcome& out, const Value& value) {
  finish(out, DriverError::none());
  out.value = value;
  return PollStatus::Ready;
}

// Ending while Transmitting: remember what the module needs to see the end of
// the line it was sent. Nothing of the body out means nothing is owed.
void Exchange::abandon_transmit() {
  owed_.clear();
  if (tx_pos_ < lead_) {                 // our own closing bytes were cut short
    owed_.assign(tx_.data() + tx_pos_, lead_ - tx_pos_);
  } else if (tx_pos_ > lead_) {
    owed_.assign(tx_[tx_pos_ - 1] == '\r' ? "\n" : "\r\n");
  }
  if (!owed_.empty()) {
    log_.logf(LogLevel::Warn, "%s aborted mid-send; line left open", to_string(current_));
  }
}

// A line answering an aborted fragment is not ours. Events never are.
bool Exchange::drop_stale() {
  if (stale_ == 0) return false;
  Event ev;
  if (parse_event(line_, ev)) return false;
  --stale_;
  log_.logf(LogLevel::Debug, "dropped '%s': answer to an aborted line", line_.c_str());
  return true;
}

void Exchange::queue_event(const Event& ev) {
  if (events_.full()) {                  // bounded: newest event is the one lost
    ++dropped_;
    log_.logf(LogLevel::Warn, "event queue full, dropped %s", to_string(ev.kind));
    return;
  }
  events_.push_back(ev);
  log_.logf(LogLevel::Info, "queued event %s", to_string(ev.kind));
}

} // namespace rn2xx3
