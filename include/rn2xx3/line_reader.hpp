/**
 * @file line_reader.hpp
 * @brief Bounded, cooperative line accumulator over a non-blocking byte transport.
 *
 * @details
 * The reader pulls whatever bytes the transport has right now, appends them to a
 * fixed buffer, and hands back one complete line per LF. Partial lines survive
 * across any number of calls, so bytes may trickle in one per poll.
 *
 * Decoding rules:
 *   - LF ends a line; a CR right before it is dropped. The limit counts line
 *     content only, never the terminator.
 *   - A line longer than the configured limit yields Overflow once. The buffer is
 *     reset and the remainder of that line is discarded up to its LF, so the next
 *     line starts clean.
 *   - A transport read error yields TransportError and drops the partial line.
 *
 * @code
 *   rn2xx3::LineReader reader;
 *   rn2xx3::RawLine line;
 *   switch (reader.poll_line(serial, line)) {
 *     case rn2xx3::LineStatus::Line:    handle(line); break;
 *     case rn2xx3::LineStatus::Pending: break;           // come back later
 *     default:                          recover(); break;
 *   }
 * @endcode
 */
#pragma once

#include "rn2xx3/transport/transport_base.hpp"
#include "rn2xx3/types.hpp"
#include <stddef.h>

namespace rn2xx3 {

enum class LineStatus : uint8_t {
  Pending = 0,     ///< No complete line yet
  Line,            ///< A line was written to the output
  Overflow,        ///< Line exceeded the limit; buffer reset
  TransportError   ///< Transport read failed; partial line dropped
};

class LineReader {
public:
  /// @param limit Maximum line length in bytes (clamped to REPLY_LINE_MAX).
  explicit LineReader(size_t limit = REPLY_LINE_MAX);

  /**
   * @brief Read available bytes until a line completes or the transport would block.
   * @param t    Transport to read from.
   * @param out  Receives the line (terminator stripped) when Line is returned.
   */
  LineStatus poll_line(transport::ITransport& t, RawLine& out);

  /// Drop any partial line and leave discard mode.
  void reset();

  /// Bytes of the partial line collected so far.
  size_t pending() const { return buf_.size(); }

  size_t limit() const { return limit_; }

private:
  RawLine buf_;
  size_t  limit_;
  bool    discarding_ = false;
  bool    cr_         = false;  ///< CR seen, not yet stored
};

} // namespace rn2xx3
