/**
 * @file number.hpp
 * @brief Number literal grammar: classifies a numeric token with a byte
 *        table and decodes it into an Integer, Uint or Float tape value.
 */

#ifndef TANDEM_JSON_NUMBER_HPP
#define TANDEM_JSON_NUMBER_HPP

#include "common.hpp"
#include "tape.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>
#include <system_error>

namespace tandem {
namespace json {

namespace number {

enum : uint8_t {
  kPartOfNumber = 1 << 0,
  kFloatOnly = 1 << 1,
  kMinus = 1 << 2,
  kEndOfValue = 1 << 3,
  kDigit = 1 << 4,
  kMustHaveDigitNext = 1 << 5
};

inline constexpr std::array<uint8_t, 256> kTable = [] {
  std::array<uint8_t, 256> t{};
  for (char c = '0'; c <= '9'; ++c)
    t[static_cast<uint8_t>(c)] = kPartOfNumber | kDigit;
  t['.'] = kPartOfNumber | kFloatOnly | kMustHaveDigitNext;
  t['+'] = kPartOfNumber;
  t['-'] = kPartOfNumber | kMinus | kMustHaveDigitNext;
  t['e'] = kPartOfNumber | kFloatOnly;
  t['E'] = kPartOfNumber | kFloatOnly;
  for (char c : {',', '}', ']', ' ', '\t', '\r', '\n', ':'})
    t[static_cast<uint8_t>(c)] = kEndOfValue;
  return t;
}();

// Longest token still attempted as a 64-bit integer ("-" + 19 digits or
// 20 unsigned digits).
inline constexpr size_t kMaxIntLen = 20;

} // namespace number

struct Number {
  Tag tag = Tag::End; // End: not a number
  uint64_t flags = 0; // FloatFlags for Tag::Float
  uint64_t value = 0; // int64 / uint64 / IEEE-754 bits
  size_t length = 0;  // bytes consumed

  explicit operator bool() const { return tag != Tag::End; }
};

namespace detail {

// from_chars reports underflow as out of range; a denormal or zero result
// is still a valid decoding of the literal.
inline bool parse_double(const char *first, const char *last, double &out) {
  auto [ptr, ec] = std::from_chars(first, last, out);
  if (ec == std::errc() && ptr == last)
    return true;
  if (ec != std::errc::result_out_of_range || ptr != last)
    return false;
  std::string tmp(first, last);
  double d = std::strtod(tmp.c_str(), nullptr);
  if (!std::isfinite(d))
    return false;
  out = d;
  return true;
}

} // namespace detail

/// Scans from buf[0] up to the first end-of-value byte (or len). Returns a
/// falsy Number on any byte outside the number alphabet, a '.' or '-' not
/// followed by a digit, a leading zero, or a literal out of double range.
inline Number parse_number(const char *buf, size_t len) {
  using namespace number;

  size_t pos = 0;
  uint8_t found = 0;
  for (size_t i = 0; i < len; ++i) {
    uint8_t t = kTable[static_cast<uint8_t>(buf[i])];
    if (t == 0)
      return Number{};
    if (t == kEndOfValue)
      break;
    if (t & kMustHaveDigitNext) {
      if (i + 1 >= len || !(kTable[static_cast<uint8_t>(buf[i + 1])] & kDigit))
        return Number{};
    }
    found |= t;
    pos = i + 1;
  }
  if (pos == 0)
    return Number{};

  const char *first = buf;
  const char *last = buf + pos;
  uint64_t float_flags = 0;

  if (!(found & kFloatOnly) && pos <= kMaxIntLen) {
    if (!(found & kMinus)) {
      if (pos > 1 && buf[0] == '0')
        return Number{};
    } else if (pos > 2 && buf[1] == '0') {
      return Number{};
    }

    int64_t i64;
    auto [iptr, iec] = std::from_chars(first, last, i64);
    if (iec == std::errc() && iptr == last)
      return Number{Tag::Integer, 0, static_cast<uint64_t>(i64), pos};
    if (iec == std::errc::result_out_of_range)
      float_flags |= kFloatOverflowedInteger;

    if (!(found & kMinus)) {
      uint64_t u64;
      auto [uptr, uec] = std::from_chars(first, last, u64);
      if (uec == std::errc() && uptr == last)
        return Number{Tag::Uint, 0, u64, pos};
      if (uec == std::errc::result_out_of_range)
        float_flags |= kFloatOverflowedInteger;
    }
  } else if (!(found & kFloatOnly)) {
    float_flags |= kFloatOverflowedInteger;
  }

  // A leading zero must be followed by a fraction or an exponent.
  const char *digits = (found & kMinus) && buf[0] == '-' ? buf + 1 : buf;
  if (last - digits > 1 && digits[0] == '0' &&
      !(kTable[static_cast<uint8_t>(digits[1])] & kFloatOnly))
    return Number{};

  double d;
  if (!detail::parse_double(first, last, d))
    return Number{};
  uint64_t bits;
  std::memcpy(&bits, &d, 8);
  return Number{Tag::Float, float_flags, bits, pos};
}

} // namespace json
} // namespace tandem

#endif // TANDEM_JSON_NUMBER_HPP
