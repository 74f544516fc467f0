#pragma once
#include <gtest/gtest.h>
#include <tandem_json/tandem_json.hpp>

namespace tandem_test {

inline tandem::json::simd::CPUFeatures capable_host() {
  tandem::json::simd::CPUFeatures f;
  f.has_avx2 = true;
  f.has_pclmul = true;
  f.has_sse42 = true;
  f.has_neon = true;
  return f;
}

inline tandem::json::simd::CPUFeatures bare_host() {
  return tandem::json::simd::CPUFeatures{};
}

// Pins the capability gate open so results do not depend on the build host.
class CapableHost : public ::testing::Test {
protected:
  tandem::json::simd::ScopedFeatureOverride host_{capable_host()};
};

} // namespace tandem_test
