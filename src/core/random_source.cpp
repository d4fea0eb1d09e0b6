#include "idkit/core/random_source.hpp"

#include <spdlog/spdlog.h>

namespace idkit::core {

Mt19937RandomSource::Mt19937RandomSource() {
  std::random_device rd;
  engine_.seed((static_cast<std::uint64_t>(rd()) << 32) | rd());
}

Mt19937RandomSource::Mt19937RandomSource(std::uint64_t seed) : engine_(seed) {
  spdlog::debug("Random source seeded with {}", seed);
}

int Mt19937RandomSource::nextInt(int low, int high) {
  std::uniform_int_distribution<int> dis(low, high);
  return dis(engine_);
}

RandomSource& defaultRandomSource() {
  static thread_local Mt19937RandomSource source;
  return source;
}

}  // namespace idkit::core
