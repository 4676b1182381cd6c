// Random number generation utilities for reproducible progression sampling.

#ifndef FIGBASS_CORE_RNG_UTIL_H
#define FIGBASS_CORE_RNG_UTIL_H

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace figbass {
namespace rng {

/// @brief Select a random index from a container.
/// @tparam Container Container type with size().
/// @param rng Mersenne Twister RNG instance.
/// @param container Non-empty container.
/// @return Random index in [0, container.size() - 1].
template <typename Container>
inline size_t selectRandomIndex(std::mt19937& rng, const Container& container) {
  std::uniform_int_distribution<size_t> dist(0, container.size() - 1);
  return dist(rng);
}

/// @brief Select a random element from a const container.
/// @tparam Container Container type with operator[] and size().
/// @param rng Mersenne Twister RNG instance.
/// @param container Non-empty container to select from.
/// @return Const reference to the selected element.
template <typename Container>
inline const auto& selectRandom(std::mt19937& rng, const Container& container) {
  return container[selectRandomIndex(rng, container)];
}

/// @brief Select an index with probability proportional to integer weights.
/// @param rng Mersenne Twister RNG instance.
/// @param weights Non-negative weights whose sum is non-zero and fits 64 bits.
/// @return Selected index.
///
/// Integer arithmetic keeps the draw exact for very large path counts.
inline size_t selectWeightedIndex(std::mt19937& rng, const std::vector<uint64_t>& weights) {
  uint64_t total = 0;
  for (uint64_t weight : weights) total += weight;
  std::uniform_int_distribution<uint64_t> dist(0, total - 1);
  uint64_t roll = dist(rng);
  uint64_t cumulative = 0;
  for (size_t idx = 0; idx < weights.size(); ++idx) {
    cumulative += weights[idx];
    if (roll < cumulative) return idx;
  }
  return weights.size() - 1;
}

/// @brief Generate a random seed using the system random device.
/// @return A non-zero random seed (suitable for seeding mt19937).
inline uint32_t generateRandomSeed() {
  std::random_device device;
  uint32_t result = device();
  if (result == 0) result = 1;
  return result;
}

}  // namespace rng
}  // namespace figbass

#endif  // FIGBASS_CORE_RNG_UTIL_H
