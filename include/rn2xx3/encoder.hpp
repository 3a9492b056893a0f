/**
 * @file encoder.hpp
 * @brief Render a `Command` into the exact ASCII line the module expects.
 *
 * Wire syntax is `VERB ARG1 ARG2...\r\n`:
 *   - binary fields (keys, EUIs, payloads) as lowercase hex, two characters per byte,
 *   - NVM addresses as lowercase hex with leading zeros trimmed ("3ab"),
 *   - counters, durations, ports and data-rate indices in decimal.
 *
 * The encoder is pure: no I/O, no heap. It writes into a caller-owned buffer.
 *
 * @code
 *   rn2xx3::CommandLine line;
 *   if (!rn2xx3::encode(rn2xx3::Command::nvm_set(0x3ab, 42), line)) {
 *     // does not fit
 *   }
 *   // line == "sys set nvm 3ab 2a\r\n"
 * @endcode
 */
#pragma once

#include "rn2xx3/command.hpp"
#include "etl/string.h"

namespace rn2xx3 {

/// Line terminator the module expects after every command.
static constexpr const char* CRLF = "\r\n";

/**
 * @brief Encode @p cmd into @p out (cleared first).
 * @return false if the rendered command would not fit; @p out is left empty.
 * @note Does not validate arguments; call validate() first.
 */
bool encode(const Command& cmd, etl::istring& out);

} // namespace rn2xx3
