#include "test_support.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <fstream>
#include <memory>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace tandem::json;

namespace {

// Reads until the pipeline closes the channel.
std::vector<Stream> collect(StreamChannel &out) {
  std::vector<Stream> items;
  while (std::optional<Stream> s = out.pop())
    items.push_back(std::move(*s));
  return items;
}

std::string records(int n, int malformed = -1) {
  std::string s;
  for (int i = 0; i < n; ++i) {
    if (i == malformed)
      s += "{\"n\":}\n";
    else
      s += "{\"n\":" + std::to_string(i) + ",\"pad\":\"" +
           std::string(static_cast<size_t>(i % 7), 'x') + "\"}\n";
  }
  return s;
}

// Record numbers across every successful item, in delivery order.
std::vector<int64_t> record_numbers(const std::vector<Stream> &items) {
  std::vector<int64_t> out;
  for (const Stream &s : items) {
    if (!s.value)
      continue;
    for (TapeView r : s.value->records())
      out.push_back(r["n"].get_int64());
  }
  return out;
}

std::vector<int64_t> iota(int n) {
  std::vector<int64_t> v;
  for (int i = 0; i < n; ++i)
    v.push_back(i);
  return v;
}

class CountingReader : public Reader {
public:
  CountingReader(std::string data, std::shared_ptr<std::atomic<int>> calls)
      : inner_(std::move(data)), calls_(std::move(calls)) {}

  size_t read(char *dst, size_t n) override {
    ++*calls_;
    return inner_.read(dst, n);
  }

private:
  MemoryReader inner_;
  std::shared_ptr<std::atomic<int>> calls_;
};

// Serves `data` on the first read and fails on the next one.
class FailingReader : public Reader {
public:
  explicit FailingReader(std::string data) : data_(std::move(data)) {}

  size_t read(char *dst, size_t n) override {
    if (served_)
      throw std::runtime_error("device unplugged");
    served_ = true;
    size_t k = std::min(n, data_.size());
    std::memcpy(dst, data_.data(), k);
    return k;
  }

private:
  std::string data_;
  bool served_ = false;
};

} // namespace

class NdjsonStream : public tandem_test::CapableHost {};

TEST_F(NdjsonStream, CleanSourceEndsWithEof) {
  auto out = std::make_shared<StreamChannel>(16);
  StreamOptions opts;
  opts.block_size = 1; // one record per chunk
  parse_ndjson_stream(std::make_unique<MemoryReader>(records(5)), out,
                      nullptr, opts);

  std::vector<Stream> items = collect(*out);
  ASSERT_EQ(items.size(), 6u);
  for (size_t i = 0; i < 5; ++i) {
    ASSERT_TRUE(items[i].value) << i;
    EXPECT_FALSE(items[i].error) << i;
    EXPECT_EQ(items[i].value->record_count(), 1u);
  }
  EXPECT_FALSE(items[5].value);
  EXPECT_TRUE(items[5].eof());
  EXPECT_EQ(record_numbers(items), iota(5));
  EXPECT_TRUE(out->closed());
}

TEST_F(NdjsonStream, EmptySourceDeliversOnlyEof) {
  auto out = std::make_shared<StreamChannel>(4);
  parse_ndjson_stream(std::make_unique<MemoryReader>(""), out);
  std::vector<Stream> items = collect(*out);
  ASSERT_EQ(items.size(), 1u);
  EXPECT_TRUE(items[0].eof());
}

TEST_F(NdjsonStream, WhitespaceOnlyChunksAreSkipped) {
  auto out = std::make_shared<StreamChannel>(4);
  StreamOptions opts;
  opts.block_size = 1;
  parse_ndjson_stream(
      std::make_unique<MemoryReader>("\n\n{\"n\":0}\n   \n\n{\"n\":1}\n\n"),
      out, nullptr, opts);
  std::vector<Stream> items = collect(*out);
  EXPECT_EQ(record_numbers(items), iota(2));
  ASSERT_FALSE(items.empty());
  EXPECT_TRUE(items.back().eof());
}

TEST_F(NdjsonStream, OrderSurvivesOutOfOrderCompletion) {
  const int kRecords = 400;
  auto out = std::make_shared<StreamChannel>(2);
  StreamOptions opts;
  opts.block_size = 100; // not aligned to record boundaries
  opts.concurrency = 4;
  opts.chunk_hook = [](size_t seq) {
    // Earlier chunks finish later.
    if (seq < 8)
      std::this_thread::sleep_for(std::chrono::milliseconds(8 * (8 - seq)));
  };
  parse_ndjson_stream(std::make_unique<MemoryReader>(records(kRecords)), out,
                      nullptr, opts);

  std::vector<Stream> items = collect(*out);
  ASSERT_FALSE(items.empty());
  EXPECT_TRUE(items.back().eof());
  EXPECT_GT(items.size(), 10u);
  EXPECT_EQ(record_numbers(items), iota(kRecords));
}

TEST_F(NdjsonStream, BlocksLargerThanInput) {
  auto out = std::make_shared<StreamChannel>(4);
  parse_ndjson_stream(std::make_unique<MemoryReader>(records(50)), out);
  std::vector<Stream> items = collect(*out);
  ASSERT_EQ(items.size(), 2u);
  EXPECT_EQ(items[0].value->record_count(), 50u);
  EXPECT_TRUE(items[1].eof());
}

TEST_F(NdjsonStream, MissingFinalNewline) {
  auto out = std::make_shared<StreamChannel>(4);
  StreamOptions opts;
  opts.block_size = 1;
  parse_ndjson_stream(std::make_unique<MemoryReader>("{\"n\":0}\n{\"n\":1}"),
                      out, nullptr, opts);
  std::vector<Stream> items = collect(*out);
  EXPECT_EQ(record_numbers(items), iota(2));
  EXPECT_TRUE(items.back().eof());
}

TEST_F(NdjsonStream, MalformedRecordTerminatesStream) {
  const int kBad = 6;
  auto out = std::make_shared<StreamChannel>(16);
  StreamOptions opts;
  opts.block_size = 1;
  opts.concurrency = 3;
  parse_ndjson_stream(std::make_unique<MemoryReader>(records(20, kBad)), out,
                      nullptr, opts);

  std::vector<Stream> items = collect(*out);
  ASSERT_EQ(items.size(), static_cast<size_t>(kBad) + 1);
  EXPECT_EQ(record_numbers(items), iota(kBad));

  const Stream &last = items.back();
  EXPECT_FALSE(last.value);
  ASSERT_TRUE(last.error);
  EXPECT_FALSE(last.eof());
  EXPECT_EQ(last.error->code, Error::TapeBuildError);
  EXPECT_EQ(std::string(last.error->what()).rfind("parsing input: ", 0), 0u);
}

TEST_F(NdjsonStream, ReadFailureIsTerminal) {
  auto out = std::make_shared<StreamChannel>(4);
  StreamOptions opts;
  opts.block_size = 1;
  parse_ndjson_stream(std::make_unique<FailingReader>("{\"n\":0}\n"), out,
                      nullptr, opts);

  std::vector<Stream> items = collect(*out);
  ASSERT_EQ(items.size(), 2u);
  EXPECT_EQ(record_numbers(items), iota(1));
  ASSERT_TRUE(items[1].error);
  EXPECT_EQ(items[1].error->code, Error::SourceIOError);
  EXPECT_EQ(std::string(items[1].error->what()),
            "reading input: device unplugged");
}

TEST_F(NdjsonStream, UnopenedFileIsReadFailure) {
  auto out = std::make_shared<StreamChannel>(4);
  auto in = std::make_unique<std::ifstream>("/nonexistent/records.ndjson");
  ASSERT_FALSE(in->is_open());
  parse_ndjson_stream(std::make_unique<IstreamReader>(std::move(in)), out);

  std::vector<Stream> items = collect(*out);
  ASSERT_EQ(items.size(), 1u);
  ASSERT_TRUE(items[0].error);
  EXPECT_FALSE(items[0].value);
  EXPECT_EQ(items[0].error->code, Error::SourceIOError);
  EXPECT_EQ(std::string(items[0].error->what()),
            "reading input: stream is not readable");
}

TEST(IstreamReaderTest, FailedStreamThrows) {
  auto in = std::make_unique<std::istringstream>("{\"n\":0}\n");
  in->setstate(std::ios::failbit);
  IstreamReader reader(std::move(in));
  char buf[16];
  EXPECT_THROW(reader.read(buf, sizeof(buf)), std::runtime_error);
}

TEST(IstreamReaderTest, ShortFinalReadIsNotAFailure) {
  IstreamReader reader(std::make_unique<std::istringstream>("abc"));
  char buf[16];
  EXPECT_EQ(reader.read(buf, sizeof(buf)), 3u);
  EXPECT_EQ(reader.read(buf, sizeof(buf)), 0u);
}

TEST_F(NdjsonStream, SlowConsumerReceivesEverything) {
  auto out = std::make_shared<StreamChannel>(1);
  StreamOptions opts;
  opts.block_size = 1;
  opts.concurrency = 2;
  parse_ndjson_stream(std::make_unique<MemoryReader>(records(30)), out,
                      nullptr, opts);

  std::vector<Stream> items;
  while (std::optional<Stream> s = out->pop()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    items.push_back(std::move(*s));
  }
  ASSERT_EQ(items.size(), 31u);
  EXPECT_EQ(record_numbers(items), iota(30));
}

TEST_F(NdjsonStream, ReusedResultsAreRecycled) {
  auto out = std::make_shared<StreamChannel>(16);
  auto reuse = std::make_shared<ReuseChannel>(4);

  std::set<const ParsedJson *> handed_back;
  for (int i = 0; i < 2; ++i) {
    auto pj = parse_document("[\"warm\"]");
    pj->message.reserve(64 << 10);
    handed_back.insert(pj.get());
    reuse->push(std::move(pj));
  }

  StreamOptions opts;
  opts.block_size = 1;
  opts.concurrency = 1;
  parse_ndjson_stream(std::make_unique<MemoryReader>(records(6)), out, reuse,
                      opts);

  std::vector<Stream> items = collect(*out);
  EXPECT_EQ(record_numbers(items), iota(6));
  ASSERT_TRUE(items[0].value);
  EXPECT_TRUE(handed_back.count(items[0].value.get()));
  EXPECT_EQ(reuse->size(), 0u);
}

TEST_F(NdjsonStream, IstreamSource) {
  auto out = std::make_shared<StreamChannel>(4);
  auto in = std::make_unique<std::istringstream>(records(10));
  StreamOptions opts;
  opts.block_size = 64;
  parse_ndjson_stream(std::make_unique<IstreamReader>(std::move(in)), out,
                      nullptr, opts);
  std::vector<Stream> items = collect(*out);
  EXPECT_EQ(record_numbers(items), iota(10));
  EXPECT_TRUE(items.back().eof());
}

TEST(NdjsonStreamCapability, UnsupportedHostReadsNothing) {
  simd::ScopedFeatureOverride host(tandem_test::bare_host());
  auto calls = std::make_shared<std::atomic<int>>(0);
  auto out = std::make_shared<StreamChannel>(4);
  parse_ndjson_stream(std::make_unique<CountingReader>(records(3), calls),
                      out);

  std::vector<Stream> items = collect(*out);
  ASSERT_EQ(items.size(), 1u);
  ASSERT_TRUE(items[0].error);
  EXPECT_EQ(items[0].error->code, Error::UnsupportedHost);
  EXPECT_EQ(calls->load(), 0);
}

// ── Helpers ────────────────────────────────────────────────────────────────

TEST(BufferedReaderTest, ReadFullAcrossSmallBuffer) {
  MemoryReader src("abcdefghijklmnopqrstuvwxyz");
  BufferedReader in(src, 4);
  char buf[10];
  EXPECT_EQ(in.read_full(buf, 10), 10u);
  EXPECT_EQ(std::string(buf, 10), "abcdefghij");
  EXPECT_EQ(in.read_full(buf, 10), 10u);
  EXPECT_EQ(std::string(buf, 10), "klmnopqrst");
  EXPECT_EQ(in.read_full(buf, 10), 6u);
  EXPECT_EQ(in.read_full(buf, 10), 0u);
}

TEST(BufferedReaderTest, ReadUntilDelimiter) {
  MemoryReader src("one\ntwo\nthree");
  BufferedReader in(src, 3);
  std::vector<char> out;
  EXPECT_TRUE(in.read_until('\n', out));
  EXPECT_EQ(std::string(out.begin(), out.end()), "one\n");
  out.clear();
  EXPECT_TRUE(in.read_until('\n', out));
  EXPECT_EQ(std::string(out.begin(), out.end()), "two\n");
  out.clear();
  EXPECT_FALSE(in.read_until('\n', out));
  EXPECT_EQ(std::string(out.begin(), out.end()), "three");
}

TEST(BufferPoolTest, RecyclesOnlyFullSizedBuffers) {
  BufferPool pool(128, 2);
  std::vector<char> small;
  small.reserve(16);
  EXPECT_FALSE(pool.release(std::move(small)));

  std::vector<char> a = pool.acquire();
  EXPECT_GE(a.capacity(), 128u);
  const char *data = a.data();
  a.push_back('x');
  EXPECT_TRUE(pool.release(std::move(a)));
  EXPECT_EQ(pool.idle(), 1u);

  std::vector<char> b = pool.acquire();
  EXPECT_TRUE(b.empty());
  EXPECT_EQ(b.data(), data);
  EXPECT_EQ(pool.idle(), 0u);
}

TEST(BufferPoolTest, IdleCountIsBounded) {
  BufferPool pool(8, 1);
  std::vector<char> a = pool.acquire();
  std::vector<char> b = pool.acquire();
  EXPECT_TRUE(pool.release(std::move(a)));
  EXPECT_FALSE(pool.release(std::move(b)));
  EXPECT_EQ(pool.idle(), 1u);
}
