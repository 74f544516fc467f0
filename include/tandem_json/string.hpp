/**
 * @file string.hpp
 * @brief String literal decoding: a validate/copy kernel (escapes, surrogate
 *        pairs, UTF-8 validation) and the arena bookkeeping around it.
 */

#ifndef TANDEM_JSON_STRING_HPP
#define TANDEM_JSON_STRING_HPP

#include "common.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

namespace tandem {
namespace json {

namespace simd {

TANDEM_INLINE size_t encode_utf8(uint32_t cp, char *dst) {
  if (cp < 0x80) {
    dst[0] = static_cast<char>(cp);
    return 1;
  }
  if (cp < 0x800) {
    dst[0] = static_cast<char>(0xC0 | (cp >> 6));
    dst[1] = static_cast<char>(0x80 | (cp & 0x3F));
    return 2;
  }
  if (cp < 0x10000) {
    dst[0] = static_cast<char>(0xE0 | (cp >> 12));
    dst[1] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    dst[2] = static_cast<char>(0x80 | (cp & 0x3F));
    return 3;
  }
  dst[0] = static_cast<char>(0xF0 | (cp >> 18));
  dst[1] = static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
  dst[2] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
  dst[3] = static_cast<char>(0x80 | (cp & 0x3F));
  return 4;
}

TANDEM_INLINE bool read_hex4(const char *p, uint32_t &out) {
  uint32_t v = 0;
  for (int i = 0; i < 4; ++i) {
    uint8_t h = lookup::hex_table[static_cast<uint8_t>(p[i])];
    if (h == 0xFF)
      return false;
    v = (v << 4) | h;
  }
  out = v;
  return true;
}

// Length of the well-formed UTF-8 sequence at p, or 0. Rejects overlong
// forms, encoded surrogates and code points above U+10FFFF.
TANDEM_INLINE size_t utf8_sequence_length(const char *p, const char *end) {
  const uint8_t *u = reinterpret_cast<const uint8_t *>(p);
  size_t avail = static_cast<size_t>(end - p);
  uint8_t b0 = u[0];
  auto cont = [](uint8_t b) { return (b & 0xC0) == 0x80; };

  if (b0 >= 0xC2 && b0 <= 0xDF) {
    return (avail >= 2 && cont(u[1])) ? 2 : 0;
  }
  if (b0 >= 0xE0 && b0 <= 0xEF) {
    if (avail < 3 || !cont(u[1]) || !cont(u[2]))
      return 0;
    if (b0 == 0xE0 && u[1] < 0xA0)
      return 0; // overlong
    if (b0 == 0xED && u[1] >= 0xA0)
      return 0; // surrogate
    return 3;
  }
  if (b0 >= 0xF0 && b0 <= 0xF4) {
    if (avail < 4 || !cont(u[1]) || !cont(u[2]) || !cont(u[3]))
      return 0;
    if (b0 == 0xF0 && u[1] < 0x90)
      return 0; // overlong
    if (b0 == 0xF4 && u[1] >= 0x90)
      return 0; // above U+10FFFF
    return 4;
  }
  return 0;
}

/// Scans a string body starting after the opening quote. On success reports
/// the raw length up to the closing quote and the decoded length; when
/// kWrite is set the decoded bytes are written to dst, which must hold at
/// least the decoded length.
template <bool kWrite>
inline bool scan_string_body(const char *src, const char *end, char *dst,
                             size_t &src_length, size_t &dst_length) {
  const uint64_t quote_mask = repeat_byte('"');
  const uint64_t bs_mask = repeat_byte('\\');
  const char *p = src;
  size_t out = 0;

  for (;;) {
    // Plain printable ASCII, 8 bytes at a time
    while (p + 8 <= end) {
      uint64_t v;
      std::memcpy(&v, p, 8);
      if ((v & 0x8080808080808080ULL) | has_zero_byte(v ^ quote_mask) |
          has_zero_byte(v ^ bs_mask) | has_control_byte(v))
        break;
      if constexpr (kWrite)
        std::memcpy(dst + out, p, 8);
      p += 8;
      out += 8;
    }
    if (TANDEM_UNLIKELY(p >= end))
      return false;

    uint8_t c = static_cast<uint8_t>(*p);
    if (c == '"') {
      src_length = static_cast<size_t>(p - src);
      dst_length = out;
      return true;
    }
    if (c < 0x20)
      return false;

    if (c == '\\') {
      if (p + 1 >= end)
        return false;
      char decoded;
      switch (p[1]) {
      case '"':
        decoded = '"';
        break;
      case '\\':
        decoded = '\\';
        break;
      case '/':
        decoded = '/';
        break;
      case 'b':
        decoded = '\b';
        break;
      case 'f':
        decoded = '\f';
        break;
      case 'n':
        decoded = '\n';
        break;
      case 'r':
        decoded = '\r';
        break;
      case 't':
        decoded = '\t';
        break;
      case 'u': {
        uint32_t cp;
        if (end - p < 6 || !read_hex4(p + 2, cp))
          return false;
        p += 6;
        if (cp >= 0xDC00 && cp <= 0xDFFF)
          return false; // lone low surrogate
        if (cp >= 0xD800 && cp <= 0xDBFF) {
          uint32_t lo;
          if (end - p < 6 || p[0] != '\\' || p[1] != 'u' ||
              !read_hex4(p + 2, lo) || lo < 0xDC00 || lo > 0xDFFF)
            return false;
          p += 6;
          cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
        }
        char tmp[4];
        size_t n = encode_utf8(cp, kWrite ? dst + out : tmp);
        out += n;
        continue;
      }
      default:
        return false;
      }
      if constexpr (kWrite)
        dst[out] = decoded;
      out++;
      p += 2;
      continue;
    }

    if (c < 0x80) {
      if constexpr (kWrite)
        dst[out] = static_cast<char>(c);
      out++;
      p++;
      continue;
    }

    size_t n = utf8_sequence_length(p, end);
    if (n == 0)
      return false;
    if constexpr (kWrite)
      std::memcpy(dst + out, p, n);
    out += n;
    p += n;
  }
}

} // namespace simd

// ============================================================================
// String Literal Decoder
// ============================================================================

/// Validate-only mode. `quote` points at the opening quote. need_copy is set
/// (never cleared) when the decoded bytes differ from the raw bytes, in which
/// case the string cannot be referenced in place.
inline bool parse_string_validate_only(const char *quote, const char *end,
                                       size_t &src_length, size_t &dst_length,
                                       bool &need_copy) {
  if (!simd::scan_string_body<false>(quote + 1, end, nullptr, src_length,
                                     dst_length))
    return false;
  need_copy = need_copy || src_length != dst_length;
  return true;
}

/// Copy mode. Appends the decoded bytes and a NUL sentinel to the arena and
/// reports where they start and how many bytes (sentinel excluded) were
/// written. The arena is left unchanged on failure.
inline bool parse_string_copy(const char *quote, const char *end,
                              std::vector<char> &arena, size_t &offset,
                              size_t &written) {
  size_t src_length, dst_length;
  if (!simd::scan_string_body<false>(quote + 1, end, nullptr, src_length,
                                     dst_length))
    return false;

  offset = arena.size();
  arena.resize(offset + dst_length + 1);
  char *dst = arena.data() + offset;
  if (src_length == dst_length) {
    std::memcpy(dst, quote + 1, src_length);
  } else {
    size_t s, d;
    if (!simd::scan_string_body<true>(quote + 1, end, dst, s, d)) {
      arena.resize(offset);
      return false;
    }
  }
  dst[dst_length] = '\0';
  written = dst_length;
  return true;
}

} // namespace json
} // namespace tandem

#endif // TANDEM_JSON_STRING_HPP
