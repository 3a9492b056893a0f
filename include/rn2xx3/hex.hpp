/**
 * @file hex.hpp
 * @brief Heap-free hex and decimal helpers used by the encoder, the parser and the host tool.
 *
 * The module speaks ASCII: binary fields travel as hex pairs, counters as decimal.
 * These helpers never allocate and never use snprintf, so they are safe on small MCUs.
 * Appending helpers write into any `etl::istring` and report false instead of truncating.
 */
#pragma once

#include "etl/string.h"
#include <stdint.h>
#include <stddef.h>

namespace rn2xx3::hex {

/// Convert one hex digit (0-9, a-f, A-F). Leaves @p out untouched on failure.
bool char_to_nibble(char c, uint8_t& out);

/// True if every character of [p, p+n) is a hex digit.
bool is_hex(const char* p, size_t n);

/**
 * @brief Decode exactly @p n_chars hex characters into bytes.
 * @param p        First hex character.
 * @param n_chars  Number of characters; must be even.
 * @param out      Destination, at least n_chars / 2 bytes.
 * @return false on odd length or a non-hex character.
 */
bool decode(const char* p, size_t n_chars, uint8_t* out);

/**
 * @brief Decode a NUL-terminated hex string of any even length.
 * @param str      Hex text, e.g. "0004a30b001a55ed".
 * @param out      Destination buffer.
 * @param cap      Capacity of @p out in bytes.
 * @param out_len  Number of bytes decoded.
 * @return false on odd length, bad digit, or if the result exceeds @p cap.
 */
bool decode_str(const char* str, uint8_t* out, size_t cap, size_t& out_len);

/// Append @p n bytes as lowercase hex pairs. False (and @p out unchanged) if it does not fit.
bool append_bytes(etl::istring& out, const uint8_t* data, size_t n);

/// Append one byte as exactly two lowercase hex digits.
bool append_byte(etl::istring& out, uint8_t b);

/// Append @p value as lowercase hex with leading zeros trimmed ("0x300" -> "300", 0 -> "0").
bool append_trimmed(etl::istring& out, uint32_t value);

/// Append @p value in decimal.
bool append_decimal(etl::istring& out, uint32_t value);

/**
 * @brief Parse an unsigned decimal number of 1..10 digits.
 * @return false on empty input, a non-digit, or overflow of 32 bits.
 */
bool parse_decimal(const char* p, size_t n, uint32_t& out);

/// Append a NUL-terminated string. False (and @p out unchanged) if it does not fit.
bool append_str(etl::istring& out, const char* s);

} // namespace rn2xx3::hex
