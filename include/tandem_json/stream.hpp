/**
 * @file stream.hpp
 * @brief NDJSON streaming: byte sources, the buffer pool, and the pipeline
 *        that parses newline-aligned chunks concurrently and delivers their
 *        results in source order.
 */

#ifndef TANDEM_JSON_STREAM_HPP
#define TANDEM_JSON_STREAM_HPP

#include "channel.hpp"
#include "common.hpp"
#include "log.hpp"
#include "parser.hpp"
#include "tape.hpp"

#include <algorithm>
#include <atomic>
#include <cstring>
#include <functional>
#include <future>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <semaphore>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace tandem {
namespace json {

// ============================================================================
// Byte Sources
// ============================================================================

/// A blocking byte source. read() returns 0 only at end of input and throws
/// on a read failure.
class Reader {
public:
  virtual ~Reader() = default;
  virtual size_t read(char *dst, size_t n) = 0;
};

class IstreamReader : public Reader {
public:
  explicit IstreamReader(std::unique_ptr<std::istream> in)
      : in_(std::move(in)) {}

  size_t read(char *dst, size_t n) override {
    if (in_->eof())
      return 0;
    check();
    in_->read(dst, static_cast<std::streamsize>(n));
    check();
    return static_cast<size_t>(in_->gcount());
  }

private:
  // failbit without eofbit means the stream never produced data, e.g. a file
  // that did not open.
  void check() const {
    if (in_->bad())
      throw std::runtime_error("stream read failed");
    if (in_->fail() && !in_->eof())
      throw std::runtime_error("stream is not readable");
  }

  std::unique_ptr<std::istream> in_;
};

class MemoryReader : public Reader {
public:
  explicit MemoryReader(std::string data) : data_(std::move(data)) {}

  size_t read(char *dst, size_t n) override {
    size_t k = std::min(n, data_.size() - pos_);
    std::memcpy(dst, data_.data() + pos_, k);
    pos_ += k;
    return k;
  }

private:
  std::string data_;
  size_t pos_ = 0;
};

/// Adds full-block reads and read-until-delimiter on top of a Reader.
class BufferedReader {
public:
  static constexpr size_t kDefaultBufferSize = 64 << 10;

  explicit BufferedReader(Reader &src, size_t buffer_size = kDefaultBufferSize)
      : src_(src), buf_(buffer_size ? buffer_size : kDefaultBufferSize) {}

  /// Reads until n bytes are copied or the source ends. Returns the count.
  size_t read_full(char *dst, size_t n) {
    size_t got = 0;
    while (got < n) {
      if (pos_ == len_) {
        if (eof_)
          break;
        // Large requests bypass the internal buffer.
        if (n - got >= buf_.size()) {
          size_t k = src_.read(dst + got, n - got);
          if (k == 0)
            eof_ = true;
          got += k;
          continue;
        }
        if (!fill())
          break;
      }
      size_t k = std::min(n - got, len_ - pos_);
      std::memcpy(dst + got, buf_.data() + pos_, k);
      pos_ += k;
      got += k;
    }
    return got;
  }

  /// Appends bytes up to and including `delim`. Returns false if the source
  /// ended first; whatever was read is still appended.
  bool read_until(char delim, std::vector<char> &out) {
    for (;;) {
      if (pos_ == len_ && !fill())
        return false;
      const char *start = buf_.data() + pos_;
      const void *hit = std::memchr(start, delim, len_ - pos_);
      size_t k = hit ? static_cast<size_t>(static_cast<const char *>(hit) -
                                           start) +
                           1
                     : len_ - pos_;
      out.insert(out.end(), start, start + k);
      pos_ += k;
      if (hit)
        return true;
    }
  }

private:
  bool fill() {
    if (eof_)
      return false;
    pos_ = 0;
    len_ = src_.read(buf_.data(), buf_.size());
    if (len_ == 0)
      eof_ = true;
    return len_ > 0;
  }

  Reader &src_;
  std::vector<char> buf_;
  size_t pos_ = 0;
  size_t len_ = 0;
  bool eof_ = false;
};

// ============================================================================
// Buffer Pool
// ============================================================================

/// Recycles chunk buffers. Both sides use try_lock: when the pool is busy,
/// acquire allocates a fresh buffer and release drops the buffer.
class BufferPool {
public:
  BufferPool(size_t buffer_size, size_t max_idle)
      : buffer_size_(buffer_size), max_idle_(max_idle) {}

  BufferPool(const BufferPool &) = delete;
  BufferPool &operator=(const BufferPool &) = delete;

  std::vector<char> acquire() {
    {
      std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
      if (lock.owns_lock() && !free_.empty()) {
        std::vector<char> buf = std::move(free_.back());
        free_.pop_back();
        buf.clear();
        return buf;
      }
    }
    std::vector<char> buf;
    buf.reserve(buffer_size_);
    return buf;
  }

  /// Keeps the buffer only if it can hold a full block. Returns whether it
  /// was kept.
  bool release(std::vector<char> &&buf) {
    if (buf.capacity() < buffer_size_)
      return false;
    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock() || free_.size() >= max_idle_)
      return false;
    free_.push_back(std::move(buf));
    return true;
  }

  size_t idle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return free_.size();
  }

  size_t buffer_size() const { return buffer_size_; }

private:
  const size_t buffer_size_;
  const size_t max_idle_;
  mutable std::mutex mutex_;
  std::vector<std::vector<char>> free_;
};

// ============================================================================
// Streaming Pipeline
// ============================================================================

/// One delivered item: a parsed chunk, or a terminal error. End of input is
/// reported as an error with code EndOfStream.
struct Stream {
  std::unique_ptr<ParsedJson> value;
  std::optional<ParseError> error;

  bool eof() const { return error && error->code == Error::EndOfStream; }
};

using StreamChannel = Channel<Stream>;
using ReuseChannel = Channel<std::unique_ptr<ParsedJson>>;

struct StreamOptions {
  size_t block_size = 10 << 20;
  size_t concurrency = 0;   // 0: half the hardware threads, rounded up
  size_t pool_capacity = 0; // 0: twice the concurrency
  std::function<void(size_t)> chunk_hook;
};

// Slack reserved past a block so the newline remainder rarely reallocates.
inline constexpr size_t kBlockSlack = 1024;

namespace detail {

inline size_t default_concurrency() {
  size_t hw = std::thread::hardware_concurrency();
  return std::max<size_t>((hw + 1) / 2, 1);
}

inline bool has_content(const std::vector<char> &chunk) {
  return std::any_of(chunk.begin(), chunk.end(),
                     [](char c) { return !lookup::is_whitespace(c); });
}

class StreamPipeline : public std::enable_shared_from_this<StreamPipeline> {
public:
  StreamPipeline(std::unique_ptr<Reader> source,
                 std::shared_ptr<StreamChannel> out,
                 std::shared_ptr<ReuseChannel> reuse, StreamOptions options)
      : source_(std::move(source)), out_(std::move(out)),
        reuse_(std::move(reuse)), options_(std::move(options)),
        block_size_(options_.block_size ? options_.block_size : 1),
        concurrency_(options_.concurrency ? options_.concurrency
                                          : default_concurrency()),
        pool_(block_size_ + kBlockSlack,
              options_.pool_capacity ? options_.pool_capacity
                                     : concurrency_ * 2),
        pending_(concurrency_),
        slots_(static_cast<std::ptrdiff_t>(concurrency_)) {}

  /// Runs the sequencer on a detached thread; it owns the reader task.
  void start() {
    TANDEM_INFO("stream: start, concurrency %zu, block %zu bytes\n",
                concurrency_, block_size_);
    std::shared_ptr<StreamPipeline> self = shared_from_this();
    std::thread([self] { self->run(); }).detach();
  }

private:
  struct Pending {
    std::future<Stream> result;
    bool holds_slot;
  };

  void run() {
    std::future<void> reader =
        std::async(std::launch::async, [this] { read_loop(); });
    sequence();
    reader.get();
    out_->close();
  }

  // ── Reader side ──

  void read_loop() {
    try {
      read_chunks();
    } catch (const std::exception &e) {
      TANDEM_WARN("stream: read failed: %s\n", e.what());
      queue_terminal(ParseError(Error::SourceIOError,
                                std::string("reading input: ") + e.what()));
    }
    pending_.close();
  }

  void read_chunks() {
    BufferedReader in(*source_);
    size_t seq = 0;
    for (;;) {
      if (stopped_.load(std::memory_order_acquire))
        return;
      std::vector<char> chunk = pool_.acquire();
      chunk.resize(block_size_);
      size_t n = in.read_full(chunk.data(), block_size_);
      chunk.resize(n);
      bool eof = n < block_size_;
      if (!eof)
        eof = !in.read_until('\n', chunk);

      if (has_content(chunk))
        dispatch(std::move(chunk), seq++);
      else
        pool_.release(std::move(chunk));

      if (eof) {
        queue_terminal(ParseError(Error::EndOfStream));
        return;
      }
    }
  }

  void dispatch(std::vector<char> &&chunk, size_t seq) {
    slots_.acquire();
    TANDEM_TRACE("stream: dispatch chunk %zu, %zu bytes\n", seq,
                 chunk.size());
    std::future<Stream> f = std::async(
        std::launch::async, [this, seq, chunk = std::move(chunk)]() mutable {
          return parse_one(std::move(chunk), seq);
        });
    if (!pending_.push(Pending{std::move(f), true}))
      slots_.release();
  }

  void queue_terminal(ParseError err) {
    std::promise<Stream> p;
    p.set_value(Stream{nullptr, std::move(err)});
    pending_.push(Pending{p.get_future(), false});
  }

  // ── Worker side ──

  Stream parse_one(std::vector<char> &&chunk, size_t seq) {
    if (options_.chunk_hook)
      options_.chunk_hook(seq);

    std::unique_ptr<ParsedJson> pj;
    if (reuse_) {
      if (std::optional<std::unique_ptr<ParsedJson>> r = reuse_->try_pop())
        pj = std::move(*r);
    }
    if (pj) {
      if (pj->message.capacity() >= pool_.buffer_size())
        pool_.release(std::move(pj->message));
    } else {
      pj = std::make_unique<ParsedJson>();
    }
    pj->scratch().options = ParseOptions{};

    try {
      parse_chunk(*pj, std::move(chunk));
    } catch (const ParseError &e) {
      return Stream{nullptr,
                    ParseError(e.code, std::string("parsing input: ") +
                                           e.what(),
                               e.offset)};
    }
    return Stream{std::move(pj), std::nullopt};
  }

  // ── Sequencer side ──

  void sequence() {
    bool ended = false;
    while (std::optional<Pending> p = pending_.pop()) {
      Stream item;
      try {
        item = p->result.get();
      } catch (const std::exception &e) {
        TANDEM_ERROR("stream: chunk task escaped with: %s\n", e.what());
        item = Stream{nullptr,
                      ParseError(Error::TapeBuildError,
                                 std::string("parsing input: ") + e.what())};
      }
      if (p->holds_slot)
        slots_.release();
      if (ended)
        continue;

      bool terminal = item.error.has_value();
      if (terminal) {
        ended = true;
        stopped_.store(true, std::memory_order_release);
        TANDEM_INFO("stream: terminal item: %s\n", item.error->what());
      }
      if (!out_->try_push(item) && !out_->push(std::move(item))) {
        // The consumer closed the output; nothing more can be delivered.
        ended = true;
        stopped_.store(true, std::memory_order_release);
      }
    }
  }

  std::unique_ptr<Reader> source_;
  std::shared_ptr<StreamChannel> out_;
  std::shared_ptr<ReuseChannel> reuse_;
  StreamOptions options_;
  const size_t block_size_;
  const size_t concurrency_;

  BufferPool pool_;
  Channel<Pending> pending_;
  std::counting_semaphore<> slots_;
  std::atomic<bool> stopped_{false};
};

} // namespace detail

/// Starts parsing newline-delimited records from `source` and returns at
/// once. Results arrive on `out` in source order, followed by exactly one
/// terminal item (end of stream or the first failure), after which `out` is
/// closed. Results handed back on `reuse` are recycled for later chunks.
inline void parse_ndjson_stream(std::unique_ptr<Reader> source,
                                std::shared_ptr<StreamChannel> out,
                                std::shared_ptr<ReuseChannel> reuse = nullptr,
                                StreamOptions options = {}) {
  if (!simd::supported_cpu()) {
    TANDEM_WARN("stream: %s\n", error_message(Error::UnsupportedHost));
    std::thread([out] {
      out->push(Stream{nullptr, ParseError(Error::UnsupportedHost)});
      out->close();
    }).detach();
    return;
  }
  std::make_shared<detail::StreamPipeline>(std::move(source), std::move(out),
                                           std::move(reuse),
                                           std::move(options))
      ->start();
}

} // namespace json
} // namespace tandem

#endif // TANDEM_JSON_STREAM_HPP
