/**
 * @file rng_util.h
 * @brief Seeded jitter draws shared by humanization and its tests.
 *
 * Every draw goes through a caller-owned std::mt19937 so that a given seed
 * always reproduces the same sequence.
 */

#ifndef SCOREPLAY_CORE_RNG_UTIL_H
#define SCOREPLAY_CORE_RNG_UTIL_H

#include <random>

namespace scoreplay {
namespace rng_util {

/// @brief Uniform integer in [lo, hi]; consumes one draw.
inline int rollRange(std::mt19937& rng, int lo, int hi) {
  std::uniform_int_distribution<int> dist(lo, hi);
  return dist(rng);
}

/// @brief Symmetric offset in [-magnitude, magnitude].
///
/// A magnitude of 0 or less returns 0 without touching the engine, so
/// disabling one jitter axis leaves the other axis' sequence unchanged.
inline int rollJitter(std::mt19937& rng, int magnitude) {
  if (magnitude <= 0) return 0;
  return rollRange(rng, -magnitude, magnitude);
}

}  // namespace rng_util
}  // namespace scoreplay

#endif  // SCOREPLAY_CORE_RNG_UTIL_H
