#include <tandem_json/index_stream.hpp>
#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <thread>
#include <vector>

using namespace tandem::json;

struct Collected {
  std::vector<uint32_t> offsets;
  IndexStream::Next terminal;
};

// Runs stage 1 on the calling thread; only valid for inputs whose batches fit
// in the queue.
static Collected collect(std::string_view s, IndexStream &stream,
                         StructuralResult *result = nullptr) {
  stream.reset();
  StructuralResult r = find_structural_indices(s.data(), s.size(), stream);
  if (result)
    *result = r;
  Collected c;
  uint32_t off;
  for (;;) {
    IndexStream::Next n = stream.next(off);
    if (n != IndexStream::Next::Offset) {
      c.terminal = n;
      break;
    }
    c.offsets.push_back(off);
  }
  return c;
}

TEST(Structural, EmitsStructuralsAndAtomStarts) {
  IndexStream stream;
  std::string_view s = R"({"a": [1, true, null]})";
  Collected c = collect(s, stream);
  EXPECT_EQ(c.terminal, IndexStream::Next::End);
  std::vector<uint32_t> expected = {0, 1, 4, 6, 7, 8, 10, 14, 16, 20, 21};
  EXPECT_EQ(c.offsets, expected);
}

TEST(Structural, StringContentsAreOpaque) {
  IndexStream stream;
  std::string_view s = R"(["a,b]{", "x\"y:z"])";
  Collected c = collect(s, stream);
  EXPECT_EQ(c.terminal, IndexStream::Next::End);
  std::vector<uint32_t> expected = {0, 1, 8, 10, 18};
  EXPECT_EQ(c.offsets, expected);
}

TEST(Structural, AtomRunsSplitOnWhitespaceAndStructurals) {
  IndexStream stream;
  std::string_view s = "12 34,5";
  Collected c = collect(s, stream);
  std::vector<uint32_t> expected = {0, 3, 5, 6};
  EXPECT_EQ(c.offsets, expected);
}

TEST(Structural, OffsetsAreStrictlyIncreasing) {
  IndexStream stream;
  std::string s = R"({"k":[1,2,3],"s":"v\\","n":null})";
  Collected c = collect(s, stream);
  ASSERT_FALSE(c.offsets.empty());
  for (size_t i = 1; i < c.offsets.size(); ++i)
    EXPECT_LT(c.offsets[i - 1], c.offsets[i]);
  EXPECT_LT(c.offsets.back(), s.size());
}

TEST(Structural, EmptyInputFails) {
  IndexStream stream;
  StructuralResult r;
  Collected c = collect("", stream, &r);
  EXPECT_FALSE(r);
  EXPECT_EQ(c.terminal, IndexStream::Next::Failed);
  EXPECT_TRUE(c.offsets.empty());
}

TEST(Structural, UnterminatedStringFails) {
  IndexStream stream;
  StructuralResult r;
  Collected c = collect(R"([1, "abc)", stream, &r);
  EXPECT_FALSE(r);
  EXPECT_EQ(r.offset, 4u);
  EXPECT_EQ(c.terminal, IndexStream::Next::Failed);

  // Offsets found before the failure are still delivered.
  std::vector<uint32_t> expected = {0, 1, 2, 4};
  EXPECT_EQ(c.offsets, expected);
}

TEST(Structural, TrailingBackslashFails) {
  IndexStream stream;
  StructuralResult r;
  Collected c = collect("\"abc\\", stream, &r);
  EXPECT_FALSE(r);
  EXPECT_EQ(c.terminal, IndexStream::Next::Failed);
}

TEST(Structural, ExactlyOneTerminal) {
  IndexStream stream;
  Collected c = collect("[]", stream);
  EXPECT_EQ(c.terminal, IndexStream::Next::End);
  EXPECT_TRUE(stream.terminal_seen());
  uint32_t off;
  // Reads past the terminal keep reporting End without blocking.
  EXPECT_EQ(stream.next(off), IndexStream::Next::End);
  EXPECT_EQ(stream.queued(), 0u);
}

TEST(Structural, ResetAllowsReuse) {
  IndexStream stream;
  Collected first = collect("[1,2]", stream);
  Collected second = collect("[1,2]", stream);
  EXPECT_EQ(first.offsets, second.offsets);
  EXPECT_EQ(second.terminal, IndexStream::Next::End);
}

// Many batches through the bounded queue with a concurrent consumer.
TEST(Structural, ConcurrentProducerConsumer) {
  std::string s = "[";
  for (int i = 0; i < 50000; ++i) {
    if (i)
      s += ',';
    s += std::to_string(i % 10);
  }
  s += ']';

  IndexStream stream;
  stream.reset();
  std::vector<uint32_t> offsets;
  IndexStream::Next terminal = IndexStream::Next::Offset;
  std::thread consumer([&] {
    uint32_t off;
    for (;;) {
      IndexStream::Next n = stream.next(off);
      if (n != IndexStream::Next::Offset) {
        terminal = n;
        return;
      }
      offsets.push_back(off);
    }
  });
  StructuralResult r = find_structural_indices(s.data(), s.size(), stream);
  consumer.join();

  EXPECT_TRUE(r);
  EXPECT_EQ(terminal, IndexStream::Next::End);
  // '[' + 50000 digits + 49999 commas + ']'
  ASSERT_EQ(offsets.size(), 100001u);
  for (size_t i = 0; i < offsets.size(); ++i)
    ASSERT_EQ(offsets[i], i);
}

// A consumer that gives up early drains so the producer can finish.
TEST(Structural, DrainUnblocksProducer) {
  std::string s(200000, ' ');
  for (size_t i = 0; i < s.size(); i += 2)
    s[i] = ',';

  IndexStream stream;
  stream.reset();
  std::thread consumer([&] {
    uint32_t off;
    for (int i = 0; i < 10; ++i)
      stream.next(off);
    stream.drain();
  });
  StructuralResult r = find_structural_indices(s.data(), s.size(), stream);
  consumer.join();
  EXPECT_TRUE(r);
  EXPECT_TRUE(stream.terminal_seen());
  EXPECT_EQ(stream.queued(), 0u);
}
