// -----------------------------------------------------------------------------
// @file hex.cpp
// @brief Hex and decimal helpers for the ASCII command set.
//
// Every helper here is heap-free and snprintf-free. Appending helpers check
// the remaining capacity first, so a failed append never leaves a half-written
// field behind in the caller's buffer.
// -----------------------------------------------------------------------------
#include "rn2xx3/hex.hpp"

namespace rn2xx3::hex {

namespace {

const char DIGITS[] = "0123456789abcdef";

bool fits(const etl::istring& out, size_t n) {
  return out.available() >= n;            // ETL: capacity left before full
}

} // namespace

// Convert a single hexadecimal character (0-9, A-F, a-f) into its numeric value (0-15)
bool char_to_nibble(char c, uint8_t& out) {
  if ('0' <= c && c <= '9') { out = static_cast<uint8_t>(c - '0');      return true; }
  if ('a' <= c && c <= 'f') { out = static_cast<uint8_t>(c - 'a' + 10); return true; }
  if ('A' <= c && c <= 'F') { out = static_cast<uint8_t>(c - 'A' + 10); return true; }
  return false;                           // invalid digit, out untouched
}

bool is_hex(const char* p, size_t n) {
  if (!p) return false;
  uint8_t v = 0;
  for (size_t i = 0; i < n; ++i) {
    if (!char_to_nibble(p[i], v)) return false;
  }
  return true;
}

// Two hex characters make one byte; odd counts are rejected up front.
bool decode(const char* p, size_t n_chars, uint8_t* out) {
  if (!p || (n_chars % 2) != 0) return false;
  if (n_chars > 0 && !out) return false;

  for (size_t i = 0; i < n_chars / 2; ++i) {
    uint8_t hi = 0, lo = 0;
    if (!char_to_nibble(p[i * 2], hi))     return false;  // high nibble
    if (!char_to_nibble(p[i * 2 + 1], lo)) return false;  // low nibble
    out[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return true;
}

bool decode_str(const char* str, uint8_t* out, size_t cap, size_t& out_len) {
  out_len = 0;
  if (!str) return false;

  size_t len = 0;
  while (str[len]) {
    ++len;
    if (len > cap * 2) return false;      // would not fit, stop scanning early
  }
  if (len % 2 != 0) return false;
  if (!decode(str, len, out)) return false;

  out_len = len / 2;
  return true;
}

bool append_byte(etl::istring& out, uint8_t b) {
  if (!fits(out, 2)) return false;
  out.push_back(DIGITS[(b >> 4) & 0x0F]);
  out.push_back(DIGITS[b & 0x0F]);
  return true;
}

bool append_bytes(etl::istring& out, const uint8_t* data, size_t n) {
  if (n > 0 && !data) return false;
  if (!fits(out, n * 2)) return false;    // all or nothing
  for (size_t i = 0; i < n; ++i) {
    out.push_back(DIGITS[(data[i] >> 4) & 0x0F]);
    out.push_back(DIGITS[data[i] & 0x0F]);
  }
  return true;
}

// Most significant non-zero nibble first; zero renders as a single "0".
bool append_trimmed(etl::istring& out, uint32_t value) {
  char tmp[8];
  size_t n = 0;
  do {
    tmp[n++] = DIGITS[value & 0x0F];
    value >>= 4;
  } while (value != 0);

  if (!fits(out, n)) return false;
  while (n > 0) out.push_back(tmp[--n]);
  return true;
}

bool append_decimal(etl::istring& out, uint32_t value) {
  char tmp[10];                           // 4294967295 has 10 digits
  size_t n = 0;
  do {
    tmp[n++] = static_cast<char>('0' + (value % 10));
    value /= 10;
  } while (value != 0);

  if (!fits(out, n)) return false;
  while (n > 0) out.push_back(tmp[--n]);
  return true;
}

bool parse_decimal(const char* p, size_t n, uint32_t& out) {
  if (!p || n == 0 || n > 10) return false;

  uint64_t acc = 0;                       // wide accumulator catches overflow
  for (size_t i = 0; i < n; ++i) {
    if (p[i] < '0' || p[i] > '9') return false;
    acc = acc * 10 + static_cast<uint64_t>(p[i] - '0');
  }
  if (acc > 0xFFFFFFFFull) return false;

  out = static_cast<uint32_t>(acc);
  return true;
}

bool append_str(etl::istring& out, const char* s) {
  if (!s) return false;
  size_t n = 0;
  while (s[n]) ++n;
  if (!fits(out, n)) return false;
  out.append(s, n);
  return true;
}

} // namespace rn2xx3::hex
