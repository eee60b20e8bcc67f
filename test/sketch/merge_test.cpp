#include <cmath>
#include <cstdint>
#include <vector>

#include "core/keys.hpp"
#include "gtest/gtest.h"
#include "hash/siphash.hpp"
#include "sketch/loglogbeta.hpp"

namespace sketch {

using SipLLB = LogLogBeta<hashfn::SipHash24>;

static SipLLB Build(unsigned p, std::uint64_t lo, std::uint64_t hi, hashfn::SipHash24 h = hashfn::SipHash24(7, 11)) {
  auto llb = SipLLB::with_precision(p, h);
  for (std::uint64_t i = lo; i < hi; ++i) {
    llb.insert(i);
  }
  return llb;
}

TEST(MergeTest, CommutativeAndAssociative) {
  const SipLLB a = Build(8, 0, 1000);
  const SipLLB b = Build(8, 1000, 3000);
  const SipLLB c = Build(8, 500, 1500);

  EXPECT_EQ(merged(a, b).registers(), merged(b, a).registers());
  EXPECT_EQ(merged(merged(a, b), c).registers(), merged(a, merged(b, c)).registers());
  EXPECT_EQ(merged(merged(a, c), b).registers(), merged(merged(c, b), a).registers());

  // the non-mutating form leaves its inputs alone
  const SipLLB a0 = Build(8, 0, 1000);
  EXPECT_EQ(a0.registers(), a.registers());
}

TEST(MergeTest, EqualsSketchOfTheUnion) {
  SipLLB a = Build(10, 0, 2000);
  const SipLLB b = Build(10, 1000, 4000);
  a.merge(b);
  EXPECT_EQ(Build(10, 0, 4000).registers(), a.registers());
}

TEST(MergeTest, Idempotent) {
  SipLLB a = Build(9, 0, 5000);
  const SipLLB before = a;
  a.merge(a);
  EXPECT_EQ(before.registers(), a.registers());
  a.merge(before);
  a.merge(before);
  EXPECT_EQ(before.registers(), a.registers());
  EXPECT_EQ(before.estimate(), a.estimate());
}

TEST(MergeTest, NeverLowersTheEstimate) {
  SipLLB a = Build(8, 0, 1000);
  const SipLLB b = Build(8, 1000, 3000);
  const double ea = a.estimate();
  const double eb = b.estimate();
  a.merge(b);
  EXPECT_GE(a.estimate(), ea);
  EXPECT_GE(a.estimate(), eb);

  // merging an empty sketch changes nothing
  const SipLLB before = a;
  a.merge(SipLLB::with_precision(8, hashfn::SipHash24(7, 11)));
  EXPECT_EQ(before.registers(), a.registers());
}

TEST(MergeTest, PrecisionMismatchLeavesBothUntouched) {
  SipLLB a(0.05, hashfn::SipHash24(1, 2));
  SipLLB b(0.02, hashfn::SipHash24(1, 2));
  ASSERT_NE(a.precision(), b.precision());
  for (std::uint64_t i = 0; i < 2000; ++i) {
    a.insert(i);
    b.insert(i + 5000);
  }
  const SipLLB a0 = a;
  const SipLLB b0 = b;

  EXPECT_THROW(a.merge(b), PrecisionMismatch);
  EXPECT_THROW(b.merge(a), PrecisionMismatch);
  EXPECT_THROW(merged(a, b), PrecisionMismatch);
  EXPECT_EQ(a0.registers(), a.registers());
  EXPECT_EQ(b0.registers(), b.registers());
}

// Disjoint halves merged should estimate the union within the configured error.
TEST(MergeTest, DisjointUnionWithinErrorBound) {
  const double truth = 10000.0;
  double abs_sum = 0.0;
  const int trials = 10;
  for (int t = 0; t < trials; ++t) {
    const std::uint64_t k0 = t + 1;
    const std::uint64_t k1 = k0 * 0x9E3779B97F4A7C15ull;
    SipLLB a = Build(12, 0, 5000, hashfn::SipHash24(k0, k1));
    const SipLLB b = Build(12, 5000, 10000, hashfn::SipHash24(k0, k1));
    a.merge(b);
    const double rel = (a.estimate() - truth) / truth;
    EXPECT_LT(std::fabs(rel), 0.065) << "trial " << t;  // 4 standard errors at p = 12
    abs_sum += std::fabs(rel);
  }
  EXPECT_LT(abs_sum / trials, 0.03);
}

TEST(MergeTest, SplitStreamsFromDataset) {
  const datasets::KeysSplit split(20000, 0xC0FFEEull);
  ASSERT_EQ(20000u, split.sizeA() + split.sizeB());

  auto a = SipLLB::with_precision(14, hashfn::SipHash24(3, 4));
  auto b = SipLLB::with_precision(14, hashfn::SipHash24(3, 4));
  const void* p;
  std::size_t len;
  auto sa = split.make_streamA();
  while (sa.next(p, len)) a.insert(p, len);
  auto sb = split.make_streamB();
  while (sb.next(p, len)) b.insert(p, len);

  a.merge(b);
  EXPECT_EQ(Build(14, 0, 20000, hashfn::SipHash24(3, 4)).registers(), a.registers());
}

}  // namespace sketch
