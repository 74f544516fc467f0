/**
 * @file tape_builder.hpp
 * @brief Stage 2: consumes structural offsets and writes the tape.
 *
 * The builder is an explicit state machine over the index stream. Open
 * containers are tracked on a scope stack of tape indices; on close the open
 * cell is backpatched with the index of its partner so navigation can skip a
 * whole container in one step.
 */

#ifndef TANDEM_JSON_TAPE_BUILDER_HPP
#define TANDEM_JSON_TAPE_BUILDER_HPP

#include "common.hpp"
#include "index_stream.hpp"
#include "number.hpp"
#include "string.hpp"
#include "tape.hpp"

#include <cstring>
#include <string>
#include <vector>

namespace tandem {
namespace json {

class TapeBuilder {
public:
  explicit TapeBuilder(ParsedJson &pj)
      : pj_(pj), scratch_(pj.scratch()), buf_(pj.message.data()),
        len_(pj.message.size()) {}

  TapeBuilder(const TapeBuilder &) = delete;
  TapeBuilder &operator=(const TapeBuilder &) = delete;

  /// Builds the whole tape. On failure error() and error_offset() describe
  /// the first problem; the index stream may still hold unread batches.
  bool build();

  const std::string &error() const { return error_; }
  size_t error_offset() const { return error_offset_; }

private:
  enum class State {
    Value,
    ObjectBegin,
    ObjectContinue,
    ArrayBegin,
    ArrayContinue,
    RecordEnd
  };

  bool fail(const char *msg, size_t offset) {
    error_ = msg;
    error_offset_ = offset;
    return false;
  }

  // Next structural offset; running out inside a value is an error.
  TANDEM_INLINE bool fetch(uint32_t &off) {
    switch (scratch_.indexes.next(off)) {
    case IndexStream::Next::Offset:
      return true;
    case IndexStream::Next::End:
      return fail("unexpected end of input", len_);
    default:
      return fail("structural discovery failed", len_);
    }
  }

  State after_value() const {
    if (scratch_.scopes.empty())
      return State::RecordEnd;
    Tag open = Element(pj_.tape[scratch_.scopes.back()]).tag();
    return open == Tag::StartObject ? State::ObjectContinue
                                    : State::ArrayContinue;
  }

  bool open_scope(Tag tag, uint32_t off) {
    if (TANDEM_UNLIKELY(scratch_.scopes.size() >= scratch_.options.max_depth))
      return fail("maximum nesting depth exceeded", off);
    scratch_.scopes.push_back(pj_.tape.size());
    pj_.tape.push_back(Element(tag, 0).data);
    return true;
  }

  void close_scope(Tag close) {
    size_t start = scratch_.scopes.back();
    scratch_.scopes.pop_back();
    size_t end = pj_.tape.size();
    Tag open = Element(pj_.tape[start]).tag();
    pj_.tape[start] = Element(open, end).data;
    pj_.tape.push_back(Element(close, start).data);
  }

  bool member_key(uint32_t &off) {
    if (buf_[off] != '"')
      return fail("expected string key", off);
    if (!string_value(off))
      return false;
    if (!fetch(off))
      return false;
    if (buf_[off] != ':')
      return fail("expected ':' after object key", off);
    return fetch(off);
  }

  bool string_value(uint32_t off);
  bool number_value(uint32_t off);
  bool literal(uint32_t off, const char *word, size_t n, Tag tag);

  ParsedJson &pj_;
  detail::Scratch &scratch_;
  const char *buf_;
  size_t len_;

  std::string error_;
  size_t error_offset_ = 0;
};

inline bool TapeBuilder::string_value(uint32_t off) {
  const char *quote = buf_ + off;
  const char *end = buf_ + len_;
  std::vector<uint64_t> &tape = pj_.tape;

  if (scratch_.options.copy_strings) {
    size_t offset, written;
    if (!parse_string_copy(quote, end, pj_.strings, offset, written))
      return fail("invalid string literal", off);
    tape.push_back(Element(Tag::String, offset | kStringInArena).data);
    tape.push_back(written);
    return true;
  }

  size_t src_length, dst_length;
  bool need_copy = false;
  if (!parse_string_validate_only(quote, end, src_length, dst_length,
                                  need_copy))
    return fail("invalid string literal", off);
  if (need_copy) {
    size_t offset, written;
    if (!parse_string_copy(quote, end, pj_.strings, offset, written))
      return fail("invalid string literal", off);
    tape.push_back(Element(Tag::String, offset | kStringInArena).data);
    tape.push_back(written);
  } else {
    // Raw bytes equal the decoded bytes: reference the message in place.
    tape.push_back(Element(Tag::String, off + 1).data);
    tape.push_back(src_length);
  }
  return true;
}

inline bool TapeBuilder::number_value(uint32_t off) {
  Number n = parse_number(buf_ + off, len_ - off);
  if (!n)
    return fail("invalid number literal", off);
  pj_.tape.push_back(Element(n.tag, n.flags).data);
  pj_.tape.push_back(n.value);
  return true;
}

inline bool TapeBuilder::literal(uint32_t off, const char *word, size_t n,
                                 Tag tag) {
  if (len_ - off < n || std::memcmp(buf_ + off, word, n) != 0)
    return fail("invalid literal", off);
  if (off + n < len_) {
    char next = buf_[off + n];
    if (!lookup::is_whitespace(next) && !lookup::is_structural(next))
      return fail("invalid literal", off);
  }
  pj_.tape.push_back(Element(tag, 0).data);
  return true;
}

inline bool TapeBuilder::build() {
  std::vector<uint64_t> &tape = pj_.tape;
  scratch_.scopes.clear();

  uint32_t off = 0;
  switch (scratch_.indexes.next(off)) {
  case IndexStream::Next::Offset:
    break;
  case IndexStream::Next::End:
    return fail("no JSON found in input", 0);
  default:
    return fail("structural discovery failed", 0);
  }

  size_t root = tape.size();
  tape.push_back(Element(Tag::Root, 0).data);

  State state = State::Value;
  for (;;) {
    switch (state) {
    case State::Value: // off holds the first byte of the value
      switch (buf_[off]) {
      case '{':
        if (!open_scope(Tag::StartObject, off))
          return false;
        state = State::ObjectBegin;
        continue;
      case '[':
        if (!open_scope(Tag::StartArray, off))
          return false;
        state = State::ArrayBegin;
        continue;
      case '"':
        if (!string_value(off))
          return false;
        break;
      case 't':
        if (!literal(off, "true", 4, Tag::True))
          return false;
        break;
      case 'f':
        if (!literal(off, "false", 5, Tag::False))
          return false;
        break;
      case 'n':
        if (!literal(off, "null", 4, Tag::Null))
          return false;
        break;
      case '-':
      case '0':
      case '1':
      case '2':
      case '3':
      case '4':
      case '5':
      case '6':
      case '7':
      case '8':
      case '9':
        if (!number_value(off))
          return false;
        break;
      default:
        return fail("unexpected character", off);
      }
      state = after_value();
      break;

    case State::ObjectBegin:
      if (!fetch(off))
        return false;
      if (buf_[off] == '}') {
        close_scope(Tag::EndObject);
        state = after_value();
        break;
      }
      if (!member_key(off))
        return false;
      state = State::Value;
      break;

    case State::ObjectContinue:
      if (!fetch(off))
        return false;
      if (buf_[off] == ',') {
        if (!fetch(off) || !member_key(off))
          return false;
        state = State::Value;
      } else if (buf_[off] == '}') {
        close_scope(Tag::EndObject);
        state = after_value();
      } else {
        return fail("expected ',' or '}' in object", off);
      }
      break;

    case State::ArrayBegin:
      if (!fetch(off))
        return false;
      if (buf_[off] == ']') {
        close_scope(Tag::EndArray);
        state = after_value();
      } else {
        state = State::Value;
      }
      break;

    case State::ArrayContinue:
      if (!fetch(off))
        return false;
      if (buf_[off] == ',') {
        if (!fetch(off))
          return false;
        state = State::Value;
      } else if (buf_[off] == ']') {
        close_scope(Tag::EndArray);
        state = after_value();
      } else {
        return fail("expected ',' or ']' in array", off);
      }
      break;

    case State::RecordEnd: {
      size_t end = tape.size();
      tape[root] = Element(Tag::Root, end).data;
      tape.push_back(Element(Tag::Root, root).data);

      switch (scratch_.indexes.next(off)) {
      case IndexStream::Next::End:
        return true;
      case IndexStream::Next::Failed:
        return fail("structural discovery failed", len_);
      default:
        break;
      }
      if (!scratch_.ndjson)
        return fail("trailing content after document", off);
      root = tape.size();
      tape.push_back(Element(Tag::Root, 0).data);
      state = State::Value;
      break;
    }
    }
  }
}

} // namespace json
} // namespace tandem

#endif // TANDEM_JSON_TAPE_BUILDER_HPP
