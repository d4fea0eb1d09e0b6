#pragma once

#include <cstdint>
#include <random>

namespace idkit::core {

/**
 * @brief Source of random integers consumed by identifier generators
 *
 * Each call to nextInt() is one draw. Generators document how many draws
 * they consume so a seeded source reproduces the same identifiers.
 */
class RandomSource {
public:
  virtual ~RandomSource() = default;

  /**
   * @brief Draw a uniformly distributed integer
   * @param low Inclusive lower bound
   * @param high Inclusive upper bound
   */
  virtual int nextInt(int low, int high) = 0;
};

/**
 * @brief RandomSource backed by a 64-bit Mersenne Twister
 */
class Mt19937RandomSource : public RandomSource {
public:
  // Seeded from std::random_device
  Mt19937RandomSource();

  explicit Mt19937RandomSource(std::uint64_t seed);

  int nextInt(int low, int high) override;

private:
  std::mt19937_64 engine_;
};

// Per-thread source seeded from std::random_device
RandomSource& defaultRandomSource();

}  // namespace idkit::core
