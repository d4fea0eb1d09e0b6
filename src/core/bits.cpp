#include "idkit/core/bits.hpp"

#include <array>
#include <utility>

namespace idkit::core::bits {

namespace {

// Base32 letters beyond the hex range and their fixed 5-bit codes
constexpr std::array<std::pair<char, int>, 16> kUpperLetterCodes = {{
    {'G', 16}, {'H', 17}, {'J', 18}, {'K', 19},
    {'M', 20}, {'N', 21}, {'P', 22}, {'Q', 23},
    {'R', 24}, {'S', 25}, {'T', 26}, {'V', 27},
    {'W', 28}, {'X', 29}, {'Y', 30}, {'Z', 31},
}};

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  return -1;
}

Bits intToBits(int value, std::size_t width) {
  Bits result(width, false);
  for (std::size_t i = 0; i < width; ++i) {
    result[width - 1 - i] = ((value >> i) & 1) != 0;
  }
  return result;
}

}  // namespace

Bits hexToBits(char c) {
  int value = hexValue(c);
  if (value < 0) {
    return {};
  }
  return intToBits(value, 4);
}

Bits base32ToBits(char c) {
  if ((c >= '0' && c <= '9') || (c >= 'A' && c <= 'F')) {
    Bits result{false};
    Bits nibble = hexToBits(c);
    result.insert(result.end(), nibble.begin(), nibble.end());
    return result;
  }

  for (const auto& [letter, code] : kUpperLetterCodes) {
    if (letter == c) {
      return intToBits(code, 5);
    }
  }

  return {};
}

std::vector<int> bitsToBaseN(std::size_t n, const Bits& bits) {
  std::vector<int> groups;
  if (n == 0) {
    return groups;
  }

  std::size_t padding = (n - bits.size() % n) % n;
  Bits padded(padding, false);
  padded.insert(padded.end(), bits.begin(), bits.end());

  groups.reserve(padded.size() / n);
  for (std::size_t offset = 0; offset < padded.size(); offset += n) {
    Bits group(padded.begin() + static_cast<std::ptrdiff_t>(offset),
               padded.begin() + static_cast<std::ptrdiff_t>(offset + n));
    groups.push_back(static_cast<int>(bitsToInt(n, group)));
  }

  return groups;
}

std::uint64_t bitsToInt(std::size_t width, const Bits& bits) {
  std::uint64_t result = 0;
  std::size_t count = width < bits.size() ? width : bits.size();

  for (std::size_t i = 0; i < count; ++i) {
    std::size_t shift = width - 1 - i;
    // Weights beyond 64 bits do not fit the result
    if (bits[i] && shift < 64) {
      result |= std::uint64_t{1} << shift;
    }
  }

  return result;
}

int base32Index(char c) noexcept {
  auto pos = kBase32Alphabet.find(c);
  return pos == std::string_view::npos ? -1 : static_cast<int>(pos);
}

char base32Char(int value) noexcept {
  return kBase32Alphabet[static_cast<std::size_t>(value) & 31u];
}

}  // namespace idkit::core::bits
