// Tests for core/rng_util.h -- seed hashing and scaling.

#include "core/rng_util.h"

#include <gtest/gtest.h>

#include <set>
#include <vector>

namespace lanefall {
namespace rng {
namespace {

// ---------------------------------------------------------------------------
// hash
// ---------------------------------------------------------------------------

TEST(RngUtilTest, HashKnownValues) {
  EXPECT_EQ(hash(0), 12345u);
  // (1103515245 * 1 + 12345) mod 2^31
  EXPECT_EQ(hash(1), 1103527590u);
}

TEST(RngUtilTest, HashStaysBelowModulus) {
  uint32_t seed = 3847589;
  for (int idx = 0; idx < 1000; ++idx) {
    seed = hash(seed);
    EXPECT_LT(seed, kModulus);
  }
}

TEST(RngUtilTest, Determinism) {
  uint32_t seed1 = 12345;
  uint32_t seed2 = 12345;
  for (int idx = 0; idx < 100; ++idx) {
    seed1 = hash(seed1);
    seed2 = hash(seed2);
    EXPECT_EQ(seed1, seed2);
  }
}

TEST(RngUtilTest, SequenceDoesNotRepeatQuickly) {
  std::set<uint32_t> seen;
  uint32_t seed = 42;
  for (int idx = 0; idx < 1000; ++idx) {
    seed = hash(seed);
    seen.insert(seed);
  }
  EXPECT_EQ(seen.size(), 1000u);
}

// ---------------------------------------------------------------------------
// scale
// ---------------------------------------------------------------------------

TEST(RngUtilTest, ScaleWithinUnitInterval) {
  uint32_t seed = 99;
  for (int idx = 0; idx < 1000; ++idx) {
    seed = hash(seed);
    double val = scale(seed);
    EXPECT_GE(val, 0.0);
    EXPECT_LT(val, 1.0);
  }
}

TEST(RngUtilTest, ScaleDoesNotAdvance) {
  uint32_t seed = hash(7);
  EXPECT_DOUBLE_EQ(scale(seed), scale(seed));
}

TEST(RngUtilTest, ScaleBoundaries) {
  EXPECT_DOUBLE_EQ(scale(0), 0.0);
  EXPECT_DOUBLE_EQ(scale(0x40000000u), 0.5);
}

TEST(RngUtilTest, ScaleDistributionRoughlyUniform) {
  uint32_t seed = 3847589;
  int low_count = 0;
  const int num_trials = 10000;
  for (int idx = 0; idx < num_trials; ++idx) {
    seed = hash(seed);
    if (scale(seed) < 0.5) ++low_count;
  }
  EXPECT_GT(low_count, 4500);
  EXPECT_LT(low_count, 5500);
}

// ---------------------------------------------------------------------------
// seedFor / scaleToInt
// ---------------------------------------------------------------------------

TEST(RngUtilTest, SeedForIsHashOfSum) {
  EXPECT_EQ(seedFor(100, 5), hash(105));
  EXPECT_NE(seedFor(100, 0), seedFor(100, 1));
}

TEST(RngUtilTest, ScaleToIntCoversRange) {
  std::set<int> seen;
  uint32_t seed = 1;
  for (int idx = 0; idx < 1000; ++idx) {
    seed = hash(seed);
    int val = scaleToInt(seed, 4);
    EXPECT_GE(val, 0);
    EXPECT_LT(val, 4);
    seen.insert(val);
  }
  EXPECT_EQ(seen.size(), 4u);
}

TEST(RngUtilTest, GenerateRandomSeedNonZero) {
  for (int idx = 0; idx < 10; ++idx) {
    uint32_t seed = generateRandomSeed();
    EXPECT_NE(seed, 0u);
    EXPECT_LT(seed, kModulus);
  }
}

}  // namespace
}  // namespace rng
}  // namespace lanefall
