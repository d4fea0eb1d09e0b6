#pragma once

#include <string>
#include <string_view>

#include "idkit/core/random_source.hpp"

namespace idkit::core {

/**
 * @brief Generation and validation of Version 4 UUID strings
 *
 * Output format: `xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx` in lowercase, where
 * `y` is one of `8`, `9`, `a`, `b`.
 */
class Uuid {
public:
  /**
   * @brief Generate a random Version 4 UUID
   *
   * Consumes exactly 31 draws in [0, 15] from `rng`.
   */
  static std::string generate(RandomSource& rng);

  // Generate using the per-thread default source
  static std::string generate();

  /**
   * @brief Check a string against the canonical 8-4-4-4-12 form
   *
   * Accepts version nibbles 1-5 and variant nibbles 8-b in either case.
   */
  static bool isValid(std::string_view str);

private:
  Uuid() = default;
};

}  // namespace idkit::core
