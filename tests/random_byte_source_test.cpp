#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <span>
#include <vector>

#include "random_byte_source.hpp"

using randfile::RandomByteSource;

TEST(RandomByteSourceTest, FillsOddSizedBuffersCompletely) {
  auto source = RandomByteSource();
  // A sentinel just past the span must survive: the tail of a draw is never over-written
  auto buffer = std::vector<char>(13 + 1, '\x5a');
  source.fill(std::span(buffer).first(13));
  EXPECT_EQ(buffer.back(), '\x5a');
  EXPECT_FALSE(std::all_of(buffer.begin(), buffer.begin() + 13, [](char c) { return c == '\x5a'; }));
}

TEST(RandomByteSourceTest, EmptySpanIsANoOp) {
  auto source = RandomByteSource();
  source.fill(std::span<char>());
  SUCCEED();
}

TEST(RandomByteSourceTest, EveryByteValueShowsUp) {
  auto source = RandomByteSource();
  auto buffer = std::vector<char>(1 << 16);
  source.fill(buffer);

  auto seen = std::array<bool, 256>{};
  for (char c : buffer) {
    seen[static_cast<unsigned char>(c)] = true;
  }
  for (size_t value = 0; value < seen.size(); ++value) {
    EXPECT_TRUE(seen[value]) << "byte " << value << " never produced";
  }
}

TEST(RandomByteSourceTest, IndependentSourcesDiverge) {
  auto first = RandomByteSource();
  auto second = RandomByteSource();
  auto a = std::vector<char>(64);
  auto b = std::vector<char>(64);
  first.fill(a);
  second.fill(b);
  EXPECT_NE(a, b);
}
