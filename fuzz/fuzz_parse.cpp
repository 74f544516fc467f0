// fuzz_parse.cpp – libFuzzer target for the tandem::json document entry points.
//
// Feeds arbitrary bytes to parse_document() and parse_ndjson_document() with
// both string modes. Inputs past 8 KiB take the concurrent two-stage path, so
// the drain-on-failure logic is exercised as well. AddressSanitizer +
// UBSanitizer are injected by the root CMakeLists.txt.
//
// Build:
//   cmake -B build-fuzz \
//         -DTANDEM_JSON_BUILD_FUZZ=ON \
//         -DTANDEM_JSON_BUILD_TESTS=OFF \
//         -DCMAKE_CXX_COMPILER=clang++
//   cmake --build build-fuzz --target fuzz_parse
//
// Run (indefinitely):
//   ./build-fuzz/fuzz_parse fuzz/corpus/ -max_len=65536
//
// Reproduce a crash:
//   ./build-fuzz/fuzz_parse <crash-file>

#include <tandem_json/tandem_json.hpp>
#include <cstddef>
#include <cstdint>
#include <string_view>

using namespace tandem::json;

static simd::CPUFeatures capable() {
    simd::CPUFeatures f;
    f.has_avx2 = f.has_pclmul = f.has_sse42 = f.has_neon = true;
    return f;
}

// The capability gate is not what is being fuzzed.
static simd::ScopedFeatureOverride g_host(capable());

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    const std::string_view input(reinterpret_cast<const char *>(data), size);

    // ── 1. Single document, copied strings ───────────────────────────────────
    try {
        auto pj = parse_document(input);
        (void)pj->root().size();
    } catch (const ParseError &) {
        // Expected for malformed input.
    }

    // ── 2. Single document, strings referenced in place ──────────────────────
    try {
        auto pj = parse_document(input, nullptr, {with_copy_strings(false)});
        for (TapeView v : pj->root())
            (void)v.tag();
    } catch (const ParseError &) {}

    // ── 3. NDJSON, shallow depth limit ───────────────────────────────────────
    try {
        auto pj = parse_ndjson_document(input, nullptr, {with_max_depth(8)});
        (void)pj->record_count();
    } catch (const ParseError &) {}

    return 0;
}
