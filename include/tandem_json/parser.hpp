/**
 * @file parser.hpp
 * @brief Parse entry points and the two-stage orchestrator.
 *
 * Small messages run stage 1 to completion and then stage 2 on the calling
 * thread. Larger ones run stage 2 on a second thread so tape building starts
 * while structural discovery is still producing offsets. Either way the
 * index queue is drained to its terminal marker before returning, so a failed
 * parse never leaves the producer blocked.
 */

#ifndef TANDEM_JSON_PARSER_HPP
#define TANDEM_JSON_PARSER_HPP

#include "common.hpp"
#include "index_stream.hpp"
#include "log.hpp"
#include "tape.hpp"
#include "tape_builder.hpp"

#include <algorithm>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tandem {
namespace json {

// ============================================================================
// Options
// ============================================================================

using ParserOption = std::function<void(ParseOptions &)>;

/// When false, strings whose decoded bytes equal their raw bytes are
/// referenced inside the retained message instead of the strings arena.
inline ParserOption with_copy_strings(bool copy) {
  return [copy](ParseOptions &o) { o.copy_strings = copy; };
}

inline ParserOption with_max_depth(size_t depth) {
  return [depth](ParseOptions &o) {
    if (depth == 0 || depth > kMaxDepth)
      throw ParseError(Error::InvalidOption,
                       "max depth must be between 1 and " +
                           std::to_string(kMaxDepth));
    o.max_depth = depth;
  };
}

namespace detail {

inline std::string_view trim(std::string_view s) {
  size_t b = 0, e = s.size();
  while (b < e && lookup::is_whitespace(s[b]))
    ++b;
  while (e > b && lookup::is_whitespace(s[e - 1]))
    --e;
  return s.substr(b, e - b);
}

inline void trim_in_place(std::vector<char> &buf) {
  size_t e = buf.size();
  while (e > 0 && lookup::is_whitespace(buf[e - 1]))
    --e;
  buf.resize(e);
  size_t b = 0;
  while (b < e && lookup::is_whitespace(buf[b]))
    ++b;
  if (b > 0)
    buf.erase(buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(b));
}

// Sizing hints: the tape is typically ~15% of the input in cells and the
// decoded strings ~10% of it in bytes.
inline void initialize(ParsedJson &pj, size_t size) {
  pj.tape.clear();
  pj.tape.reserve(size * 15 / 100 + 2);
  pj.strings.clear();
  pj.strings.reserve(std::max<size_t>(size / 10, 128));
  Scratch &s = pj.scratch();
  s.scopes.clear();
  s.scopes.reserve(s.options.max_depth);
  s.indexes.reset();
}

/// Parses pj.message (already trimmed) into pj.tape. Throws ParseError.
inline void parse_message(ParsedJson &pj, bool ndjson) {
  Scratch &s = pj.scratch();
  s.ndjson = ndjson;
  const size_t len = pj.message.size();
  initialize(pj, len);

  const char *buf = pj.message.data();
  TapeBuilder builder(pj);
  StructuralResult stage1;
  bool stage2 = false;

  if (len <= kSequentialThreshold) {
    TANDEM_TRACE("parse: sequential, %zu bytes\n", len);
    stage1 = find_structural_indices(buf, len, s.indexes);
    if (stage1)
      stage2 = builder.build();
    if (!s.indexes.terminal_seen())
      s.indexes.drain();
  } else {
    TANDEM_TRACE("parse: concurrent, %zu bytes\n", len);
    std::future<bool> consumer =
        std::async(std::launch::async, [&builder, &s]() {
          try {
            bool ok = builder.build();
            if (!s.indexes.terminal_seen())
              s.indexes.drain();
            return ok;
          } catch (...) {
            if (!s.indexes.terminal_seen())
              s.indexes.drain();
            throw;
          }
        });
    try {
      stage1 = find_structural_indices(buf, len, s.indexes);
    } catch (...) {
      // The consumer waits for a terminal marker that never came.
      s.indexes.finish(false);
      consumer.wait();
      throw;
    }
    stage2 = consumer.get();
  }

  // Stage 1 failures take precedence: stage 2 only saw their symptom.
  if (!stage1) {
    TANDEM_WARN("parse: structural error at %zu: %s\n", stage1.offset,
                stage1.message);
    throw ParseError(Error::StructuralError, stage1.message, stage1.offset);
  }
  if (!stage2) {
    TANDEM_WARN("parse: tape error at %zu: %s\n", builder.error_offset(),
                builder.error().c_str());
    throw ParseError(Error::TapeBuildError, builder.error(),
                     builder.error_offset());
  }
  TANDEM_TRACE("parse: %zu tape cells, %zu string bytes\n", pj.tape.size(),
               pj.strings.size());
}

// Takes over the caller's result when given one, otherwise allocates.
// Options always start from their defaults.
inline std::unique_ptr<ParsedJson>
prepare(std::unique_ptr<ParsedJson> reuse,
        const std::vector<ParserOption> &options) {
  if (!simd::supported_cpu())
    throw ParseError(Error::UnsupportedHost);
  std::unique_ptr<ParsedJson> pj =
      reuse ? std::move(reuse) : std::make_unique<ParsedJson>();
  ParseOptions &o = pj->scratch().options;
  o = ParseOptions{};
  for (const ParserOption &opt : options)
    opt(o);
  return pj;
}

/// Parses one NDJSON chunk, taking ownership of its bytes.
inline void parse_chunk(ParsedJson &pj, std::vector<char> &&chunk) {
  pj.message = std::move(chunk);
  trim_in_place(pj.message);
  parse_message(pj, true);
}

inline std::unique_ptr<ParsedJson>
parse(std::string_view json, std::unique_ptr<ParsedJson> reuse,
      const std::vector<ParserOption> &options, bool ndjson) {
  std::unique_ptr<ParsedJson> pj = prepare(std::move(reuse), options);
  std::string_view body = trim(json);
  pj->message.assign(body.begin(), body.end());
  parse_message(*pj, ndjson);
  return pj;
}

} // namespace detail

// ============================================================================
// Entry points
// ============================================================================

/// Parses a single JSON document. A previous result can be handed back as
/// `reuse` so its buffers are recycled. Throws ParseError.
inline std::unique_ptr<ParsedJson>
parse_document(std::string_view json,
               std::unique_ptr<ParsedJson> reuse = nullptr,
               const std::vector<ParserOption> &options = {}) {
  return detail::parse(json, std::move(reuse), options, false);
}

/// Parses newline-delimited JSON held entirely in memory. Every record gets
/// its own Root pair on the tape.
inline std::unique_ptr<ParsedJson>
parse_ndjson_document(std::string_view ndjson,
                      std::unique_ptr<ParsedJson> reuse = nullptr,
                      const std::vector<ParserOption> &options = {}) {
  return detail::parse(ndjson, std::move(reuse), options, true);
}

} // namespace json
} // namespace tandem

#endif // TANDEM_JSON_PARSER_HPP
