// ============================================================================
// hex.cpp: implementation for hex.hpp
// Small, explicit loops. No locale, no stdlib conversions, no heap.
// ============================================================================

#include "rn2903/hex.hpp"

namespace rn2903 {

static const char HEX_DIGITS[] = "0123456789abcdef";

// Value of one hex digit, or -1.
static int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

static bool push(etl::istring& out, char c) {
  if (out.full()) return false;
  out.push_back(c);
  return true;
}

bool append_hex_u8(etl::istring& out, uint8_t v) {
  if (out.size() + 2 > out.capacity()) return false;
  out.push_back(HEX_DIGITS[v >> 4]);
  out.push_back(HEX_DIGITS[v & 0x0F]);
  return true;
}

bool append_hex(etl::istring& out, uint32_t v) {
  char tmp[8];
  size_t n = 0;
  do {
    tmp[n++] = HEX_DIGITS[v & 0x0F];
    v >>= 4;
  } while (v != 0);
  if (out.size() + n > out.capacity()) return false;
  while (n > 0) out.push_back(tmp[--n]);            // digits were collected backwards
  return true;
}

bool append_hex_bytes(etl::istring& out, const uint8_t* data, size_t len) {
  if (out.size() + 2 * len > out.capacity()) return false;
  for (size_t i = 0; i < len; ++i) append_hex_u8(out, data[i]);
  return true;
}

bool append_dec(etl::istring& out, uint32_t v) {
  char tmp[10];
  size_t n = 0;
  do {
    tmp[n++] = static_cast<char>('0' + (v % 10));
    v /= 10;
  } while (v != 0);
  if (out.size() + n > out.capacity()) return false;
  while (n > 0) out.push_back(tmp[--n]);
  return true;
}

bool append_dec_signed(etl::istring& out, int32_t v) {
  if (v < 0) {
    if (!push(out, '-')) return false;
    // -(INT32_MIN) does not fit in int32_t; widen first
    return append_dec(out, static_cast<uint32_t>(-(static_cast<int64_t>(v))));
  }
  return append_dec(out, static_cast<uint32_t>(v));
}

bool parse_hex_u64(const char* s, size_t len, uint64_t& out) {
  if (!s || len == 0 || len > 16) return false;
  uint64_t v = 0;
  for (size_t i = 0; i < len; ++i) {
    int d = hex_value(s[i]);
    if (d < 0) return false;
    v = (v << 4) | static_cast<uint64_t>(d);
  }
  out = v;
  return true;
}

bool parse_hex_u32(const char* s, size_t len, uint32_t& out) {
  uint64_t v = 0;
  if (len > 8 || !parse_hex_u64(s, len, v)) return false;
  out = static_cast<uint32_t>(v);
  return true;
}

bool parse_hex_u8(const char* s, size_t len, uint8_t& out) {
  uint64_t v = 0;
  if (len > 2 || !parse_hex_u64(s, len, v)) return false;
  out = static_cast<uint8_t>(v);
  return true;
}

bool parse_hex_bytes(const char* s, size_t len, etl::ivector<uint8_t>& out) {
  out.clear();
  if (!s && len) return false;
  if (len % 2 != 0) return false;                   // half a byte is a framing error
  if (len / 2 > out.capacity()) return false;
  for (size_t i = 0; i < len; i += 2) {
    int hi = hex_value(s[i]);
    int lo = hex_value(s[i + 1]);
    if (hi < 0 || lo < 0) { out.clear(); return false; }
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return true;
}

bool parse_dec_u32(const char* s, size_t len, uint32_t& out) {
  if (!s || len == 0 || len > 10) return false;
  uint64_t v = 0;
  for (size_t i = 0; i < len; ++i) {
    if (s[i] < '0' || s[i] > '9') return false;
    v = v * 10 + static_cast<uint64_t>(s[i] - '0');
  }
  if (v > 0xFFFFFFFFull) return false;
  out = static_cast<uint32_t>(v);
  return true;
}

} // namespace rn2903
