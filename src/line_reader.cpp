// -----------------------------------------------------------------------------
// line_reader.cpp: bounded LF-terminated line assembly
//
// POLICY:
//   - Drain the transport until it would block or a line completes; never
//     return more than one line per call so the caller sees them in order.
//   - Overflow is reported once per overlong line. Bytes up to its LF are
//     then swallowed so the tail of that line is not mistaken for a reply.
//   - A CR is held back until the next byte shows whether it is part of the
//     CRLF terminator, so it never counts against the limit.
// -----------------------------------------------------------------------------
#include "rn2xx3/line_reader.hpp"

namespace rn2xx3 {

LineReader::LineReader(size_t limit)
: limit_(limit == 0 || limit > REPLY_LINE_MAX ? REPLY_LINE_MAX : limit) {}

void LineReader::reset() {
  buf_.clear();                           // drop partial line
  discarding_ = false;                    // next byte starts a fresh line
  cr_         = false;
}

LineStatus LineReader::poll_line(transport::ITransport& t, RawLine& out) {
  for (;;) {
    uint8_t b = 0;
    const transport::ReadStatus rs = t.try_read_byte(b);

    if (rs == transport::ReadStatus::WouldBlock) return LineStatus::Pending;
    if (rs == transport::ReadStatus::Error) {
      reset();                            // partial line is unusable now
      return LineStatus::TransportError;
    }

    if (discarding_) {                    // tail of an overlong line
      if (b == '\n') discarding_ = false;
      continue;
    }

    if (b == '\n') {                      // terminator; pending CR is dropped
      out = buf_;
      buf_.clear();
      cr_ = false;
      return LineStatus::Line;
    }

    // A held CR followed by anything but LF is line content after all.
    const size_t need = (cr_ ? 1u : 0u) + (b == '\r' ? 0u : 1u);
    if (buf_.size() + need > limit_) {
      buf_.clear();
      cr_         = false;
      discarding_ = true;
      return LineStatus::Overflow;
    }
    if (cr_) {
      buf_.push_back('\r');
      cr_ = false;
    }
    if (b == '\r') cr_ = true;
    else           buf_.push_back(static_cast<char>(b));
  }
}

} // namespace rn2xx3
