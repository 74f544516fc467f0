/**
 * @file common.hpp
 * @brief Tandem JSON - platform detection, CPU capability gate, errors and
 *        byte classification tables shared by every stage.
 *
 * License: MIT
 */

#ifndef TANDEM_JSON_COMMON_HPP
#define TANDEM_JSON_COMMON_HPP

#include <atomic>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <string>

#if __cplusplus < 202002L
#error "Tandem JSON requires a C++20 compatible compiler."
#endif

// ============================================================================
// Architecture Detection
// ============================================================================

#if defined(__x86_64__) || defined(_M_X64)
#define TANDEM_ARCH_X86_64 1
#elif defined(__aarch64__) || defined(_M_ARM64)
#define TANDEM_ARCH_ARM64 1
#endif

#ifdef __GNUC__
#define TANDEM_INLINE __attribute__((always_inline)) inline
#define TANDEM_LIKELY(x) __builtin_expect(!!(x), 1)
#define TANDEM_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define TANDEM_INLINE inline
#define TANDEM_LIKELY(x) (x)
#define TANDEM_UNLIKELY(x) (x)
#endif

namespace tandem {
namespace json {
namespace simd {

// CPU features detected at runtime
struct CPUFeatures {
  bool has_avx2{false};
  bool has_pclmul{false};
  bool has_sse42{false};
  bool has_neon{false};

  static const CPUFeatures &detected() {
    static CPUFeatures features = detect();
    return features;
  }

  // Features the gate evaluates: the detected set unless a test replaced it.
  static const CPUFeatures &active() {
    const CPUFeatures *o = override_slot().load(std::memory_order_acquire);
    return o ? *o : detected();
  }

  static std::atomic<const CPUFeatures *> &override_slot() {
    static std::atomic<const CPUFeatures *> slot{nullptr};
    return slot;
  }

private:
  static CPUFeatures detect() {
    CPUFeatures f;

#if defined(TANDEM_ARCH_X86_64)
#if defined(__GNUC__) || defined(__clang__)
    __builtin_cpu_init();

    f.has_sse42 = __builtin_cpu_supports("sse4.2");
    f.has_avx2 = __builtin_cpu_supports("avx2");
    f.has_pclmul = __builtin_cpu_supports("pclmul");
#endif
#elif defined(TANDEM_ARCH_ARM64)
    // NEON and PMULL are baseline on ARM64
    f.has_neon = true;
    f.has_pclmul = true;
#endif

    return f;
  }
};

/// Replaces the detected feature set for the lifetime of the object. Used to
/// simulate hosts that lack the required instruction sets.
class ScopedFeatureOverride {
  CPUFeatures features_;
  const CPUFeatures *previous_;

public:
  explicit ScopedFeatureOverride(const CPUFeatures &features)
      : features_(features),
        previous_(CPUFeatures::override_slot().exchange(
            &features_, std::memory_order_acq_rel)) {}

  ~ScopedFeatureOverride() {
    CPUFeatures::override_slot().store(previous_, std::memory_order_release);
  }

  ScopedFeatureOverride(const ScopedFeatureOverride &) = delete;
  ScopedFeatureOverride &operator=(const ScopedFeatureOverride &) = delete;
};

// Carry-less multiply plus 256-bit vectors (x86), or NEON plus PMULL (ARM).
inline bool supported_cpu() {
  const CPUFeatures &f = CPUFeatures::active();
#if defined(TANDEM_ARCH_X86_64)
  return f.has_avx2 && f.has_pclmul;
#elif defined(TANDEM_ARCH_ARM64)
  return f.has_neon && f.has_pclmul;
#else
  (void)f;
  return false;
#endif
}

// SWAR (SIMD Within A Register) primitives
TANDEM_INLINE uint64_t repeat_byte(uint8_t b) {
  return 0x0101010101010101ULL * b;
}

TANDEM_INLINE uint64_t has_zero_byte(uint64_t v) {
  return (v - 0x0101010101010101ULL) & ~v & 0x8080808080808080ULL;
}

// Bytes below 0x20. Bytes >= 0x80 are masked out first so multi-byte UTF-8
// never reports a false positive.
TANDEM_INLINE uint64_t has_control_byte(uint64_t v) {
  return (v - repeat_byte(0x20)) & ~v & 0x8080808080808080ULL;
}

/// Returns the first '"' or '\\' in [p, end), or end.
TANDEM_INLINE const char *scan_string_swar(const char *p, const char *end) {
  const uint64_t quote_mask = repeat_byte('"');
  const uint64_t bs_mask = repeat_byte('\\');

  while (p + 8 <= end) {
    uint64_t v;
    std::memcpy(&v, p, 8);
    uint64_t match = has_zero_byte(v ^ quote_mask) | has_zero_byte(v ^ bs_mask);
    if (match) {
      // The lowest flagged byte is exact; borrows only corrupt higher lanes.
      return p + (std::countr_zero(match) >> 3);
    }
    p += 8;
  }
  while (p < end && *p != '"' && *p != '\\') {
    p++;
  }
  return p;
}

} // namespace simd

// ============================================================================
// Error Handling
// ============================================================================

enum class Error {
  Ok = 0,
  UnsupportedHost,
  StructuralError,
  TapeBuildError,
  SourceIOError,
  InvalidOption,
  EndOfStream
};

inline const char *error_message(Error e) {
  switch (e) {
  case Error::Ok:
    return "No error";
  case Error::UnsupportedHost:
    return "Host CPU does not meet target specs";
  case Error::StructuralError:
    return "Failed to find all structural indices for stage 1";
  case Error::TapeBuildError:
    return "Bad parsing while executing stage 2";
  case Error::SourceIOError:
    return "Source read failed";
  case Error::InvalidOption:
    return "Invalid parser option";
  case Error::EndOfStream:
    return "End of stream";
  default:
    return "Unknown error";
  }
}

class ParseError : public std::runtime_error {
public:
  Error code;
  size_t offset;

  ParseError(Error c, const std::string &msg, size_t off = 0)
      : std::runtime_error(msg), code(c), offset(off) {}

  explicit ParseError(Error c) : ParseError(c, error_message(c)) {}

  std::string format() const {
    std::ostringstream oss;
    oss << "Parse error";
    if (code == Error::TapeBuildError || code == Error::StructuralError)
      oss << " at offset " << offset;
    oss << ": " << what();
    return oss.str();
  }
};

class TypeError : public std::runtime_error {
public:
  TypeError(const std::string &msg) : std::runtime_error(msg) {}
};

// ============================================================================
// Lookup Tables
// ============================================================================

namespace lookup {

// Hex character to value (0xFF = invalid)
alignas(64) inline constexpr uint8_t hex_table[256] = {
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 0x09, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x0A, 0x0B, 0x0C, 0x0D, 0x0E, 0x0F, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0x0A, 0x0B, 0x0C, 0x0D, 0x0E, 0x0F, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF};

// Escape check table (1 = needs escape when serialized)
alignas(64) inline constexpr uint8_t escape_table[256] = {
    1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, // 0-15
    1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, // 16-31
    0, 0, 1, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // 32-47: '"' (34)
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // 48-63
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // 64-79
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1, 0, 0, 0, // 80-95: '\\' (92)
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // 96-111
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // 112-127
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // 128-143
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // 144-159
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // 160-175
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // 176-191
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // 192-207
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // 208-223
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // 224-239
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0  // 240-255
};

// Whitespace check using bit manipulation
// Bitmap: ' '=32, '\t'=9, '\n'=10, '\r'=13
TANDEM_INLINE bool is_whitespace(char c) {
  unsigned char uc = static_cast<unsigned char>(c);
  return uc <= 32 && ((0x100002600ULL >> uc) & 1);
}

TANDEM_INLINE bool needs_escape(char c) {
  return escape_table[static_cast<unsigned char>(c)] != 0;
}

// '{', '}', '[', ']', ':', ','
TANDEM_INLINE bool is_structural(char c) {
  return c == '{' || c == '}' || c == '[' || c == ']' || c == ':' || c == ',';
}

} // namespace lookup

} // namespace json
} // namespace tandem

#endif // TANDEM_JSON_COMMON_HPP
