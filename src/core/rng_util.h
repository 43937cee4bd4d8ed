// Seed-threaded random number utilities for reproducible game replays.

#ifndef LANEFALL_CORE_RNG_UTIL_H
#define LANEFALL_CORE_RNG_UTIL_H

#include <cstddef>
#include <cstdint>
#include <random>

namespace lanefall {
namespace rng {

/// Linear congruential generator parameters (glibc-style, modulus 2^31).
constexpr uint64_t kModulus = 0x80000000ull;
constexpr uint64_t kMultiplier = 1103515245ull;
constexpr uint64_t kIncrement = 12345ull;

/// @brief Advance a seed by one step.
///
/// Pure and stateless: the caller threads the returned seed forward
/// (through State::hash in the engine). Same seed, same sequence.
///
/// @param seed Current seed.
/// @return Next seed in [0, 2^31).
inline uint32_t hash(uint32_t seed) {
  return static_cast<uint32_t>((kMultiplier * seed + kIncrement) % kModulus);
}

/// @brief Derive a uniform sample in [0, 1) from a seed without advancing it.
/// @param seed Seed produced by hash().
/// @return Sample in [0, 1).
inline double scale(uint32_t seed) {
  return static_cast<double>(seed % kModulus) / static_cast<double>(kModulus);
}

/// @brief Derive a per-item sub-seed (hash of seed + index).
inline uint32_t seedFor(uint32_t seed, size_t index) {
  return hash(static_cast<uint32_t>(seed + index));
}

/// @brief Scale a seed onto an integer range [0, bound).
/// @param seed Seed to sample.
/// @param bound Exclusive upper bound (must be > 0).
inline int scaleToInt(uint32_t seed, int bound) {
  int val = static_cast<int>(scale(seed) * bound);
  return val < bound ? val : bound - 1;
}

/// @brief Generate a random seed using the system random device.
/// @return A non-zero random seed already passed through hash().
inline uint32_t generateRandomSeed() {
  std::random_device device;
  uint32_t result = hash(device());
  if (result == 0) result = 1;
  return result;
}

}  // namespace rng
}  // namespace lanefall

#endif  // LANEFALL_CORE_RNG_UTIL_H
