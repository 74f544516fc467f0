/**
 * @file tape.hpp
 * @brief The tape: 64-bit tagged cells, the parse result that owns them, and
 *        zero-overhead navigation and serialization over a finished tape.
 *
 * Cell layout: [ Tag (8) | Payload (56) ]
 *
 *   Root            payload = index of the partner Root cell
 *   Start/End       payload = index of the partner container cell
 *   String          payload = byte offset (+ kStringInArena), next cell = length
 *   Integer / Uint  payload = 0, next cell = value
 *   Float           payload = FloatFlags, next cell = IEEE-754 bits
 *   True/False/Null payload = 0
 */

#ifndef TANDEM_JSON_TAPE_HPP
#define TANDEM_JSON_TAPE_HPP

#include "common.hpp"
#include "index_stream.hpp"

#include <charconv>
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tandem {
namespace json {

enum class Tag : uint8_t {
  End = 0,
  Root = 'r',
  StartObject = '{',
  EndObject = '}',
  StartArray = '[',
  EndArray = ']',
  String = '"',
  Integer = 'l',
  Uint = 'u',
  Float = 'd',
  True = 't',
  False = 'f',
  Null = 'n'
};

inline constexpr unsigned kTagShift = 56;
inline constexpr uint64_t kPayloadMask = (1ULL << kTagShift) - 1;

// Set on a String cell when the offset refers to the strings arena rather
// than the retained message.
inline constexpr uint64_t kStringInArena = 1ULL << 55;

enum FloatFlags : uint64_t {
  kFloatOverflowedInteger = 1 // integral literal outside 64-bit range
};

inline constexpr size_t kMaxDepth = 1024;

struct Element {
  uint64_t data;

  Element() : data(0) {}
  explicit Element(uint64_t raw) : data(raw) {}
  Element(Tag t, uint64_t payload)
      : data((static_cast<uint64_t>(t) << kTagShift) | (payload & kPayloadMask)) {
  }

  Tag tag() const { return static_cast<Tag>(data >> kTagShift); }
  uint64_t payload() const { return data & kPayloadMask; }
};

inline const char *tag_name(Tag t) {
  switch (t) {
  case Tag::Root:
    return "root";
  case Tag::StartObject:
    return "object";
  case Tag::EndObject:
    return "end object";
  case Tag::StartArray:
    return "array";
  case Tag::EndArray:
    return "end array";
  case Tag::String:
    return "string";
  case Tag::Integer:
    return "integer";
  case Tag::Uint:
    return "uint";
  case Tag::Float:
    return "float";
  case Tag::True:
  case Tag::False:
    return "bool";
  case Tag::Null:
    return "null";
  default:
    return "end";
  }
}

// Working state the option functions operate on. Reset before each parse.
struct ParseOptions {
  bool copy_strings = true;
  size_t max_depth = kMaxDepth;
};

namespace detail {

// Per-parser scratch state carried along when a result is reused.
struct Scratch {
  IndexStream indexes;
  std::vector<uint64_t> scopes;
  ParseOptions options;
  bool ndjson = false;
};

} // namespace detail

class TapeView;

class ParsedJson {
public:
  std::vector<uint64_t> tape;
  std::vector<char> strings;
  std::vector<char> message;

  ParsedJson() = default;
  ParsedJson(ParsedJson &&) = default;
  ParsedJson &operator=(ParsedJson &&) = default;
  ParsedJson(const ParsedJson &) = delete;
  ParsedJson &operator=(const ParsedJson &) = delete;

  /// Logical truncation; capacity is kept for the next parse.
  void reset() {
    tape.clear();
    strings.clear();
    message.clear();
  }

  detail::Scratch &scratch() {
    if (!scratch_)
      scratch_ = std::make_unique<detail::Scratch>();
    return *scratch_;
  }

  /// Value of the first record.
  TapeView root() const;

  /// Value of every root-wrapped record, in document order.
  std::vector<TapeView> records() const;

  size_t record_count() const {
    size_t n = 0;
    for (size_t i = 0; i < tape.size(); i = Element(tape[i]).payload() + 1)
      ++n;
    return n;
  }

  std::string to_json() const;

  std::string_view string_at(uint64_t payload, uint64_t length) const {
    const std::vector<char> &src =
        (payload & kStringInArena) ? strings : message;
    return std::string_view(src.data() + (payload & ~kStringInArena),
                            static_cast<size_t>(length));
  }

private:
  std::unique_ptr<detail::Scratch> scratch_;
};

// ============================================================================
// Tape View (Zero-Overhead Accessor)
// ============================================================================

struct Member;

class TapeView {
  const ParsedJson *pj_;
  size_t index_;

  static constexpr size_t kInvalid = std::numeric_limits<size_t>::max();

public:
  TapeView() : pj_(nullptr), index_(kInvalid) {}
  TapeView(const ParsedJson &pj, size_t index) : pj_(&pj), index_(index) {}

  bool is_valid() const { return pj_ && index_ < pj_->tape.size(); }
  size_t index() const { return index_; }

  Tag tag() const {
    if (!is_valid())
      return Tag::End;
    return Element(pj_->tape[index_]).tag();
  }

  bool is_object() const { return tag() == Tag::StartObject; }
  bool is_array() const { return tag() == Tag::StartArray; }
  bool is_string() const { return tag() == Tag::String; }
  bool is_null() const { return tag() == Tag::Null; }
  bool is_bool() const { return tag() == Tag::True || tag() == Tag::False; }
  bool is_number() const {
    Tag t = tag();
    return t == Tag::Integer || t == Tag::Uint || t == Tag::Float;
  }

  bool is_overflowed_integer() const {
    return tag() == Tag::Float &&
           (Element(pj_->tape[index_]).payload() & kFloatOverflowedInteger);
  }

  bool get_bool() const {
    Tag t = tag();
    if (t != Tag::True && t != Tag::False)
      throw TypeError(std::string("value is not a bool but ") + tag_name(t));
    return t == Tag::True;
  }

  int64_t get_int64() const {
    switch (tag()) {
    case Tag::Integer:
      return static_cast<int64_t>(value_cell());
    case Tag::Uint: {
      uint64_t u = value_cell();
      if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
        throw TypeError("unsigned value overflows int64");
      return static_cast<int64_t>(u);
    }
    case Tag::Float: {
      double d = get_double();
      // 2^63 is exactly representable; anything at or past it overflows.
      if (!(d >= -9223372036854775808.0 && d < 9223372036854775808.0))
        throw TypeError("float value overflows int64");
      return static_cast<int64_t>(d);
    }
    default:
      throw TypeError(std::string("value is not a number but ") +
                      tag_name(tag()));
    }
  }

  uint64_t get_uint64() const {
    switch (tag()) {
    case Tag::Uint:
      return value_cell();
    case Tag::Integer: {
      int64_t i = static_cast<int64_t>(value_cell());
      if (i < 0)
        throw TypeError("negative value cannot be uint64");
      return static_cast<uint64_t>(i);
    }
    case Tag::Float: {
      double d = get_double();
      if (!(d >= 0.0 && d < 18446744073709551616.0))
        throw TypeError("float value overflows uint64");
      return static_cast<uint64_t>(d);
    }
    default:
      throw TypeError(std::string("value is not a number but ") +
                      tag_name(tag()));
    }
  }

  double get_double() const {
    switch (tag()) {
    case Tag::Float: {
      double d;
      uint64_t bits = value_cell();
      std::memcpy(&d, &bits, 8);
      return d;
    }
    case Tag::Integer:
      return static_cast<double>(static_cast<int64_t>(value_cell()));
    case Tag::Uint:
      return static_cast<double>(value_cell());
    default:
      throw TypeError(std::string("value is not a number but ") +
                      tag_name(tag()));
    }
  }

  std::string_view get_string() const {
    if (tag() != Tag::String)
      throw TypeError(std::string("value is not a string but ") +
                      tag_name(tag()));
    return pj_->string_at(Element(pj_->tape[index_]).payload(), value_cell());
  }

  /// Index of the cell following this value. Containers are skipped in
  /// O(1) through the partner link.
  size_t next_index() const {
    Element e(pj_->tape[index_]);
    switch (e.tag()) {
    case Tag::StartObject:
    case Tag::StartArray:
      return e.payload() + 1;
    case Tag::String:
    case Tag::Integer:
    case Tag::Uint:
    case Tag::Float:
      return index_ + 2;
    default:
      return index_ + 1;
    }
  }

  /// Elements of an array or members of an object.
  size_t size() const {
    if (!is_array() && !is_object())
      return 0;
    size_t end = Element(pj_->tape[index_]).payload();
    size_t n = 0;
    for (size_t cur = index_ + 1; cur < end;
         cur = TapeView(*pj_, cur).next_index())
      ++n;
    return is_object() ? n / 2 : n;
  }

  TapeView operator[](size_t idx) const {
    if (!is_array())
      return TapeView();
    size_t end = Element(pj_->tape[index_]).payload();
    size_t cur = index_ + 1;
    for (size_t i = 0; i < idx && cur < end; ++i)
      cur = TapeView(*pj_, cur).next_index();
    if (cur >= end)
      return TapeView();
    return TapeView(*pj_, cur);
  }

  TapeView operator[](std::string_view key) const {
    std::optional<TapeView> v = find(key);
    return v ? *v : TapeView();
  }

  /// First member with the given key; objects are scanned in order.
  std::optional<TapeView> find(std::string_view key) const {
    if (!is_object())
      return std::nullopt;
    size_t end = Element(pj_->tape[index_]).payload();
    size_t cur = index_ + 1;
    while (cur < end) {
      TapeView k(*pj_, cur);
      TapeView v(*pj_, cur + 2);
      if (k.get_string() == key)
        return v;
      cur = v.next_index();
    }
    return std::nullopt;
  }

  class iterator {
    const ParsedJson *pj_;
    size_t index_;

  public:
    iterator(const ParsedJson *pj, size_t index) : pj_(pj), index_(index) {}
    TapeView operator*() const { return TapeView(*pj_, index_); }
    iterator &operator++() {
      index_ = TapeView(*pj_, index_).next_index();
      return *this;
    }
    bool operator==(const iterator &o) const { return index_ == o.index_; }
    bool operator!=(const iterator &o) const { return index_ != o.index_; }
  };

  // Array element iteration. Non-arrays iterate as empty.
  iterator begin() const {
    if (!is_array())
      return iterator(pj_, 0);
    return iterator(pj_, index_ + 1);
  }
  iterator end() const {
    if (!is_array())
      return iterator(pj_, 0);
    return iterator(pj_, Element(pj_->tape[index_]).payload());
  }

  std::vector<Member> members() const;

private:
  uint64_t value_cell() const { return pj_->tape[index_ + 1]; }
};

struct Member {
  std::string_view key;
  TapeView value;
};

inline std::vector<Member> TapeView::members() const {
  std::vector<Member> out;
  if (!is_object())
    return out;
  size_t end = Element(pj_->tape[index_]).payload();
  for (size_t cur = index_ + 1; cur < end;) {
    TapeView v(*pj_, cur + 2);
    out.push_back(Member{TapeView(*pj_, cur).get_string(), v});
    cur = v.next_index();
  }
  return out;
}

inline TapeView ParsedJson::root() const {
  if (tape.empty())
    return TapeView();
  return TapeView(*this, 1);
}

inline std::vector<TapeView> ParsedJson::records() const {
  std::vector<TapeView> out;
  for (size_t i = 0; i < tape.size(); i = Element(tape[i]).payload() + 1)
    out.emplace_back(*this, i + 1);
  return out;
}

// ============================================================================
// Tape Serializer (minified JSON, one line per record)
// ============================================================================

class TapeSerializer {
  const ParsedJson &pj_;
  std::string &out_;

  struct Frame {
    bool object;
    size_t count;
  };
  std::vector<Frame> stack_;

public:
  TapeSerializer(const ParsedJson &pj, std::string &out) : pj_(pj), out_(out) {}

  void serialize() {
    const std::vector<uint64_t> &tape = pj_.tape;
    out_.reserve(out_.size() + pj_.message.size() + 16);

    bool first_record = true;
    for (size_t i = 0; i < tape.size();) {
      size_t close = Element(tape[i]).payload();
      if (!first_record)
        out_ += '\n';
      first_record = false;
      write_range(i + 1, close);
      i = close + 1;
    }
  }

private:
  void separator() {
    if (stack_.empty())
      return;
    Frame &f = stack_.back();
    if (f.object) {
      if (f.count % 2 == 1)
        out_ += ':';
      else if (f.count > 0)
        out_ += ',';
    } else if (f.count > 0) {
      out_ += ',';
    }
    f.count++;
  }

  void write_range(size_t begin, size_t end) {
    const std::vector<uint64_t> &tape = pj_.tape;
    stack_.clear();
    for (size_t i = begin; i < end;) {
      Element e(tape[i]);
      switch (e.tag()) {
      case Tag::StartObject:
      case Tag::StartArray:
        separator();
        out_ += e.tag() == Tag::StartObject ? '{' : '[';
        stack_.push_back(Frame{e.tag() == Tag::StartObject, 0});
        i++;
        break;
      case Tag::EndObject:
      case Tag::EndArray:
        out_ += e.tag() == Tag::EndObject ? '}' : ']';
        stack_.pop_back();
        i++;
        break;
      case Tag::String:
        separator();
        write_string(pj_.string_at(e.payload(), tape[i + 1]));
        i += 2;
        break;
      case Tag::Integer:
        separator();
        write_number(static_cast<int64_t>(tape[i + 1]));
        i += 2;
        break;
      case Tag::Uint:
        separator();
        write_number(tape[i + 1]);
        i += 2;
        break;
      case Tag::Float: {
        separator();
        double d;
        uint64_t bits = tape[i + 1];
        std::memcpy(&d, &bits, 8);
        write_float(d);
        i += 2;
        break;
      }
      case Tag::True:
        separator();
        out_ += "true";
        i++;
        break;
      case Tag::False:
        separator();
        out_ += "false";
        i++;
        break;
      case Tag::Null:
        separator();
        out_ += "null";
        i++;
        break;
      default:
        i++;
        break;
      }
    }
  }

  template <typename T> void write_number(T v) {
    char buf[24];
    auto res = std::to_chars(buf, buf + sizeof(buf), v);
    out_.append(buf, res.ptr);
  }

  // Floats always carry a fraction or exponent so they re-parse as floats.
  void write_float(double d) {
    char buf[40];
    auto res = std::to_chars(buf, buf + sizeof(buf), d);
    std::string_view s(buf, static_cast<size_t>(res.ptr - buf));
    out_ += s;
    if (s.find_first_of(".eE") == std::string_view::npos)
      out_ += ".0";
  }

  void write_string(std::string_view s) {
    static const char hex[] = "0123456789abcdef";
    out_ += '"';
    for (char c : s) {
      if (!lookup::needs_escape(c)) {
        out_ += c;
        continue;
      }
      switch (c) {
      case '"':
        out_ += "\\\"";
        break;
      case '\\':
        out_ += "\\\\";
        break;
      case '\b':
        out_ += "\\b";
        break;
      case '\f':
        out_ += "\\f";
        break;
      case '\n':
        out_ += "\\n";
        break;
      case '\r':
        out_ += "\\r";
        break;
      case '\t':
        out_ += "\\t";
        break;
      default: {
        unsigned char uc = static_cast<unsigned char>(c);
        out_ += "\\u00";
        out_ += hex[uc >> 4];
        out_ += hex[uc & 0xF];
        break;
      }
      }
    }
    out_ += '"';
  }
};

inline std::string ParsedJson::to_json() const {
  std::string out;
  TapeSerializer(*this, out).serialize();
  return out;
}

} // namespace json
} // namespace tandem

#endif // TANDEM_JSON_TAPE_HPP
