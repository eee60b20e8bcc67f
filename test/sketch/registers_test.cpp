#include "sketch/registers.hpp"

#include <cstdint>
#include <stdexcept>
#include <vector>

#include "gtest/gtest.h"

namespace sketch {

TEST(RegisterArrayTest, StartsAtZero) {
  RegisterArray r(16);
  ASSERT_EQ(16u, r.size());
  ASSERT_EQ(16u, r.count_zeros());
  for (std::size_t i = 0; i < r.size(); ++i) {
    ASSERT_EQ(0, r.get(i));
  }
  // 16 registers * 6 bits = 96 bits -> 2 words
  ASSERT_EQ(2u, r.words().size());
  EXPECT_THROW(RegisterArray(0), std::invalid_argument);
}

TEST(RegisterArrayTest, RaiseNeverLowers) {
  RegisterArray r(32);
  r.raise(5, 7);
  ASSERT_EQ(7, r.get(5));
  r.raise(5, 3);
  ASSERT_EQ(7, r.get(5));
  r.raise(5, 7);
  ASSERT_EQ(7, r.get(5));
  r.raise(5, 12);
  ASSERT_EQ(12, r.get(5));
  ASSERT_EQ(31u, r.count_zeros());
}

TEST(RegisterArrayTest, RaiseSaturatesAtSixBits) {
  RegisterArray r(16);
  r.raise(0, 200);
  ASSERT_EQ(RegisterArray::MAX_VALUE, r.get(0));
  ASSERT_EQ(0, r.get(1));
}

// Every value at every bit alignment, including registers that straddle two words.
TEST(RegisterArrayTest, PackingIsolatesNeighbours) {
  const std::size_t m = 64;
  for (std::size_t i = 0; i < m; ++i) {
    RegisterArray r(m);
    for (std::uint8_t v = 1; v <= RegisterArray::MAX_VALUE; ++v) {
      r.raise(i, v);
      ASSERT_EQ(v, r.get(i)) << "register " << i;
    }
    for (std::size_t j = 0; j < m; ++j) {
      if (j != i) {
        ASSERT_EQ(0, r.get(j)) << "register " << j << " disturbed by " << i;
      }
    }
  }

  RegisterArray all(m);
  for (std::size_t i = 0; i < m; ++i) all.raise(i, static_cast<std::uint8_t>((i * 7) % 64));
  for (std::size_t i = 0; i < m; ++i) {
    ASSERT_EQ((i * 7) % 64, all.get(i));
  }
  ASSERT_EQ(RegisterArray::MAX_VALUE, all.max_value());
}

TEST(RegisterArrayTest, PointwiseMax) {
  RegisterArray a(16), b(16);
  a.raise(0, 4);
  a.raise(1, 9);
  b.raise(1, 2);
  b.raise(2, 11);

  RegisterArray c = a.pointwise_max(b);
  EXPECT_EQ(4, c.get(0));
  EXPECT_EQ(9, c.get(1));
  EXPECT_EQ(11, c.get(2));
  EXPECT_EQ(13u, c.count_zeros());
  EXPECT_EQ(c, b.pointwise_max(a));

  // inputs untouched
  EXPECT_EQ(0, a.get(2));
  EXPECT_EQ(0, b.get(0));

  EXPECT_THROW(a.pointwise_max(RegisterArray(32)), std::invalid_argument);
}

TEST(RegisterArrayTest, FromWords) {
  RegisterArray a(16);
  a.raise(10, 33);
  a.raise(15, 61);
  RegisterArray b = RegisterArray::from_words(16, a.words());
  EXPECT_EQ(a, b);

  EXPECT_THROW(RegisterArray::from_words(16, std::vector<std::uint64_t>(3, 0)), std::invalid_argument);
  // bits 96..127 of a 16-register array are padding
  const std::vector<std::uint64_t> padded = {0, 1ull << 40};
  EXPECT_THROW(RegisterArray::from_words(16, padded), std::invalid_argument);
}

}  // namespace sketch
