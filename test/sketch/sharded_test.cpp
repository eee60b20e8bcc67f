#include "sketch/sharded.hpp"

#include <cstdint>
#include <span>
#include <string_view>
#include <thread>  // NOLINT
#include <vector>

#include "gtest/gtest.h"
#include "hash/siphash.hpp"

namespace sketch {

using SipLLB = LogLogBeta<hashfn::SipHash24>;

static std::vector<std::uint64_t> Iota(std::uint64_t n) {
  std::vector<std::uint64_t> v(n);
  for (std::uint64_t i = 0; i < n; ++i) v[i] = i;
  return v;
}

TEST(ShardedTest, MatchesSerialBuild) {
  const std::vector<std::uint64_t> keys = Iota(50000);
  const hashfn::SipHash24 h(3, 5);

  auto serial = SipLLB::with_precision(10, h);
  for (auto k : keys) serial.insert(k);

  for (unsigned threads : {1u, 2u, 3u, 8u}) {
    const SipLLB par = build_sharded(std::span<const std::uint64_t>(keys), 10, threads, h);
    EXPECT_EQ(serial.registers(), par.registers()) << threads << " threads";
    EXPECT_EQ(serial.estimate(), par.estimate());
  }
}

TEST(ShardedTest, MoreThreadsThanItems) {
  const std::vector<std::uint64_t> keys = Iota(3);
  const hashfn::SipHash24 h(1, 1);
  auto serial = SipLLB::with_precision(6, h);
  for (auto k : keys) serial.insert(k);

  const SipLLB par = build_sharded(std::span<const std::uint64_t>(keys), 6, 16, h);
  EXPECT_EQ(serial.registers(), par.registers());

  const std::vector<std::uint64_t> none;
  EXPECT_EQ(0.0, build_sharded(std::span<const std::uint64_t>(none), 6, 4, h).estimate());
}

TEST(ShardedTest, StringItems) {
  const std::vector<std::string_view> words = {"the", "quick", "brown", "fox", "jumps", "over", "the", "lazy", "dog"};
  const hashfn::SipHash24 h(8, 9);
  auto serial = SipLLB::with_precision(8, h);
  for (auto w : words) serial.insert(w);

  const SipLLB par = build_sharded(std::span<const std::string_view>(words), 8, 4, h);
  EXPECT_EQ(serial.registers(), par.registers());
  EXPECT_NEAR(8.0, par.estimate(), 1.5);
}

TEST(ShardedTest, BadPrecisionThrowsBeforeStartingWorkers) {
  const std::vector<std::uint64_t> keys = Iota(10);
  EXPECT_THROW(build_sharded(std::span<const std::uint64_t>(keys), 2, 4, hashfn::SipHash24()), InvalidPrecision);
}

TEST(ShardedTest, MergeAll) {
  std::vector<SipLLB> parts;
  for (std::uint64_t s = 0; s < 4; ++s) {
    auto llb = SipLLB::with_precision(9, hashfn::SipHash24(2, 2));
    for (std::uint64_t i = s * 1000; i < (s + 1) * 1000; ++i) llb.insert(i);
    parts.push_back(llb);
  }
  auto whole = SipLLB::with_precision(9, hashfn::SipHash24(2, 2));
  for (std::uint64_t i = 0; i < 4000; ++i) whole.insert(i);

  EXPECT_EQ(whole.registers(), merge_all(std::span<const SipLLB>(parts)).registers());

  parts.push_back(SipLLB::with_precision(10, hashfn::SipHash24(2, 2)));
  EXPECT_THROW(merge_all(std::span<const SipLLB>(parts)), PrecisionMismatch);
  EXPECT_THROW(merge_all(std::span<const SipLLB>()), std::invalid_argument);
}

TEST(ShardedTest, LockedSketchSharedByThreads) {
  const hashfn::SipHash24 h(5, 6);
  LockedLogLogBeta<hashfn::SipHash24> shared(SipLLB::with_precision(11, h));

  std::vector<std::thread> pool;
  for (std::uint64_t t = 0; t < 4; ++t) {
    pool.emplace_back([&shared, t]() {
      for (std::uint64_t i = t * 5000; i < (t + 1) * 5000; ++i) {
        shared.insert(i);
        if (i % 1000 == 0) {
          EXPECT_GE(shared.estimate(), 0.0);
        }
      }
    });
  }
  for (auto& th : pool) th.join();

  auto serial = SipLLB::with_precision(11, h);
  for (std::uint64_t i = 0; i < 20000; ++i) serial.insert(i);
  EXPECT_EQ(serial.registers(), shared.snapshot().registers());
  EXPECT_EQ(serial.estimate(), shared.estimate());

  auto extra = SipLLB::with_precision(11, h);
  for (std::uint64_t i = 20000; i < 21000; ++i) extra.insert(i);
  shared.merge(extra);
  serial.merge(extra);
  EXPECT_EQ(serial.registers(), shared.snapshot().registers());
  EXPECT_THROW(shared.merge(SipLLB::with_precision(12, h)), PrecisionMismatch);
}

}  // namespace sketch
