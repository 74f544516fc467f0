/**
 * @file index_stream.hpp
 * @brief Stage 1: structural index discovery and the bounded index queue
 *        connecting it to the tape builder.
 */

#ifndef TANDEM_JSON_INDEX_STREAM_HPP
#define TANDEM_JSON_INDEX_STREAM_HPP

#include "channel.hpp"
#include "common.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

namespace tandem {
namespace json {

// Offsets are produced in batches. Each batch lives in one of kIndexSlots
// buffers; the queue holds kIndexSlots - 2 batches so that the slot the
// consumer is reading and the slot the producer is filling are never
// overwritten.
inline constexpr size_t kIndexSlots = 16;
inline constexpr size_t kIndexBatchSize = 4096;
inline constexpr size_t kIndexQueueDepth = kIndexSlots - 2;

// Messages up to this size run stage 1 and stage 2 back to back.
inline constexpr size_t kSequentialThreshold = 8 << 10;

inline constexpr size_t kMaxMessageSize = std::numeric_limits<uint32_t>::max();

// Sequential mode runs stage 1 to completion before anything is consumed, so
// a whole small message plus its terminal marker must fit in the queue.
static_assert((kSequentialThreshold + kIndexBatchSize - 1) / kIndexBatchSize +
                      1 <=
                  kIndexQueueDepth,
              "index queue too shallow for sequential parsing");

struct IndexBatch {
  static constexpr int32_t kEnd = -1;
  static constexpr int32_t kFailed = -2;

  int32_t slot;    // >= 0: buffer index, otherwise a terminal marker
  uint32_t length; // offsets in the slot
};

class IndexStream {
public:
  enum class Next { Offset, End, Failed };

  IndexStream() : queue_(kIndexQueueDepth) {}

  IndexStream(const IndexStream &) = delete;
  IndexStream &operator=(const IndexStream &) = delete;

  /// Prepares for a new message. Neither side may be running.
  void reset() {
    while (queue_.try_pop()) {
    }
    write_slot_ = 0;
    write_len_ = 0;
    read_slot_ = -1;
    read_pos_ = 0;
    read_len_ = 0;
    terminal_seen_ = false;
  }

  // ── Producer side ──

  TANDEM_INLINE void emit(uint32_t offset) {
    std::vector<uint32_t> &slot = slots_[write_slot_];
    if (TANDEM_UNLIKELY(slot.size() < kIndexBatchSize))
      slot.resize(kIndexBatchSize);
    slot[write_len_++] = offset;
    if (TANDEM_UNLIKELY(write_len_ == kIndexBatchSize))
      flush();
  }

  /// Sends the partial batch and exactly one terminal marker.
  void finish(bool ok) {
    if (write_len_ > 0)
      flush();
    queue_.push(
        IndexBatch{ok ? IndexBatch::kEnd : IndexBatch::kFailed, 0});
  }

  // ── Consumer side ──

  TANDEM_INLINE Next next(uint32_t &offset) {
    if (TANDEM_LIKELY(read_pos_ < read_len_)) {
      offset = slots_[read_slot_][read_pos_++];
      return Next::Offset;
    }
    return next_batch(offset);
  }

  /// True once the consumer has taken the terminal marker off the queue.
  bool terminal_seen() const { return terminal_seen_; }

  /// Consumes queued batches up to and including the terminal marker so a
  /// producer blocked on a full queue can finish.
  void drain() {
    while (!terminal_seen_) {
      std::optional<IndexBatch> batch = queue_.pop();
      if (!batch || batch->slot < 0)
        terminal_seen_ = true;
    }
    read_pos_ = read_len_ = 0;
  }

  size_t queued() const { return queue_.size(); }

private:
  void flush() {
    queue_.push(IndexBatch{static_cast<int32_t>(write_slot_),
                           static_cast<uint32_t>(write_len_)});
    write_slot_ = (write_slot_ + 1) % kIndexSlots;
    write_len_ = 0;
  }

  Next next_batch(uint32_t &offset) {
    if (terminal_seen_)
      return Next::End;
    for (;;) {
      std::optional<IndexBatch> batch = queue_.pop();
      if (!batch || batch->slot == IndexBatch::kFailed) {
        terminal_seen_ = true;
        read_pos_ = read_len_ = 0;
        return Next::Failed;
      }
      if (batch->slot == IndexBatch::kEnd) {
        terminal_seen_ = true;
        read_pos_ = read_len_ = 0;
        return Next::End;
      }
      read_slot_ = batch->slot;
      read_len_ = batch->length;
      read_pos_ = 0;
      if (read_len_ > 0) {
        offset = slots_[read_slot_][read_pos_++];
        return Next::Offset;
      }
    }
  }

  std::array<std::vector<uint32_t>, kIndexSlots> slots_;
  Channel<IndexBatch> queue_;

  // Producer state
  size_t write_slot_ = 0;
  size_t write_len_ = 0;

  // Consumer state
  int32_t read_slot_ = -1;
  uint32_t read_pos_ = 0;
  uint32_t read_len_ = 0;
  bool terminal_seen_ = false;
};

struct StructuralResult {
  bool ok = true;
  const char *message = "";
  size_t offset = 0;

  explicit operator bool() const { return ok; }
};

/// Emits the offset of every structural character and the first byte of
/// every string and scalar literal, in ascending order, followed by one
/// terminal marker. Fails on empty or oversized input and on an unterminated
/// string.
inline StructuralResult find_structural_indices(const char *buf, size_t len,
                                                IndexStream &out) {
  if (len == 0) {
    out.finish(false);
    return StructuralResult{false, "no JSON found in input", 0};
  }
  if (len > kMaxMessageSize) {
    out.finish(false);
    return StructuralResult{false, "input exceeds 4 GiB", 0};
  }

  const char *const end = buf + len;
  const char *p = buf;
  bool in_atom = false;

  while (p < end) {
    char c = *p;
    if (c == '"') {
      const char *quote = p;
      out.emit(static_cast<uint32_t>(p - buf));
      in_atom = false;
      // Skip the string body; an escape consumes the following byte.
      ++p;
      for (;;) {
        p = simd::scan_string_swar(p, end);
        if (TANDEM_UNLIKELY(p >= end || (*p == '\\' && p + 1 >= end))) {
          out.finish(false);
          return StructuralResult{false, "unterminated string",
                                  static_cast<size_t>(quote - buf)};
        }
        if (*p == '"')
          break;
        p += 2;
      }
      ++p;
      continue;
    }
    if (lookup::is_structural(c)) {
      out.emit(static_cast<uint32_t>(p - buf));
      in_atom = false;
    } else if (lookup::is_whitespace(c)) {
      in_atom = false;
    } else if (!in_atom) {
      out.emit(static_cast<uint32_t>(p - buf));
      in_atom = true;
    }
    ++p;
  }

  out.finish(true);
  return StructuralResult{};
}

} // namespace json
} // namespace tandem

#endif // TANDEM_JSON_INDEX_STREAM_HPP
