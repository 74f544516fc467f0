// fuzz_tape.cpp – libFuzzer target for the tape layout and serializer.
//
// Every input that parses must serialize to JSON that parses again, and the
// second serialization must equal the first. Any mismatch is reported as a
// crash. A single ParsedJson is recycled across runs so the reuse path sees
// stale capacity from earlier inputs.
//
// Build / run instructions are identical to fuzz_parse.cpp – just swap the
// target name:
//   cmake --build build-fuzz --target fuzz_tape
//   ./build-fuzz/fuzz_tape fuzz/corpus/ -max_len=65536

#include <tandem_json/tandem_json.hpp>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <string>
#include <string_view>

using namespace tandem::json;

static simd::CPUFeatures capable() {
    simd::CPUFeatures f;
    f.has_avx2 = f.has_pclmul = f.has_sse42 = f.has_neon = true;
    return f;
}

static simd::ScopedFeatureOverride g_host(capable());

// libFuzzer is single-threaded by default, so static storage is safe here.
static std::unique_ptr<ParsedJson> g_doc = std::make_unique<ParsedJson>();

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    const std::string_view input(reinterpret_cast<const char *>(data), size);

    std::string first;
    try {
        g_doc = parse_ndjson_document(input, std::move(g_doc));
        first = g_doc->to_json();
    } catch (const ParseError &) {
        g_doc = std::make_unique<ParsedJson>();
        return 0;
    }

    // Serialized output must always be accepted.
    std::unique_ptr<ParsedJson> again;
    try {
        again = parse_ndjson_document(first);
    } catch (const ParseError &) {
        std::abort();
    }
    if (again->to_json() != first || again->record_count() != g_doc->record_count())
        std::abort();

    return 0;
}
