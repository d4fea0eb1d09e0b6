#include "idkit/core/uuid.hpp"

#include <array>
#include <regex>

#include "idkit/core/bits.hpp"

namespace idkit::core {

namespace {

constexpr std::size_t kRandomDigits = 31;

char hexChar(int value) {
  return bits::kHexDigits[static_cast<std::size_t>(value) & 15u];
}

}  // namespace

std::string Uuid::generate(RandomSource& rng) {
  std::array<int, kRandomDigits> digits{};
  for (auto& digit : digits) {
    digit = rng.nextInt(0, 15);
  }

  std::string result;
  result.reserve(36);

  // Group 1: 8 random digits
  for (std::size_t i = 0; i < 8; ++i) result += hexChar(digits[i]);
  result += '-';

  // Group 2: 4 random digits
  for (std::size_t i = 8; i < 12; ++i) result += hexChar(digits[i]);
  result += '-';

  // Group 3: version 4 followed by 3 random digits
  result += '4';
  for (std::size_t i = 12; i < 15; ++i) result += hexChar(digits[i]);
  result += '-';

  // Group 4: variant digit forced into 8-b
  result += hexChar((digits[15] & 3) | 8);
  for (std::size_t i = 16; i < 19; ++i) result += hexChar(digits[i]);
  result += '-';

  // Group 5: 12 random digits
  for (std::size_t i = 19; i < kRandomDigits; ++i) result += hexChar(digits[i]);

  return result;
}

std::string Uuid::generate() {
  return generate(defaultRandomSource());
}

bool Uuid::isValid(std::string_view str) {
  static const std::regex uuid_regex(
      R"([0-9a-f]{8}-[0-9a-f]{4}-[1-5][0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12})",
      std::regex::icase);
  return std::regex_match(str.begin(), str.end(), uuid_regex);
}

}  // namespace idkit::core
