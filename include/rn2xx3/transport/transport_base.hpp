#pragma once
/**
 * @file transport_base.hpp
 * @brief Minimal, driver-agnostic byte transport interface for the RN2xx3 driver.
 *
 * Header-only on purpose for easy embedding. No STL in the embedded path.
 *
 * Any UART, USB CDC, PTY or test double can back the driver as long as it
 * can answer two questions without blocking: "is there a byte for me?" and
 * "can you take this byte?".
 */

#include <cstddef>
#include <cstdint>

namespace rn2xx3::transport {

// Return codes kept simple for embedded sanity.
enum class ReadStatus  : uint8_t { Ready=0, WouldBlock=1, Error=2 };
enum class WriteStatus : uint8_t { Sent=0,  WouldBlock=1, Error=2 };

/**
 * @brief Transport trait every serial wrapper implements.
 *
 * Contract:
 *  - try_read_byte(out) returns Ready and fills @p out when a byte is waiting,
 *    WouldBlock when nothing is buffered, Error on a link failure.
 *  - try_write_byte(b) returns Sent once the byte is accepted, WouldBlock when
 *    the output side is full (retry later), Error on a link failure.
 *  - Neither call may block the caller for longer than a register access.
 *  - name() is a short identifier for logs/diagnostics.
 *
 * Implementations must be movable: the driver takes the transport by value
 * and hands it back on destroy().
 */
class ITransport {
public:
  virtual ~ITransport() = default;
  virtual ReadStatus  try_read_byte(uint8_t& out) = 0;
  virtual WriteStatus try_write_byte(uint8_t b) = 0;
  virtual const char* name() const = 0;

protected:
  ITransport() = default;
  ITransport(const ITransport&) = default;
  ITransport(ITransport&&) = default;
  ITransport& operator=(const ITransport&) = default;
  ITransport& operator=(ITransport&&) = default;
};

} // namespace rn2xx3::transport
