#include "idkit/core/ulid.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

#include "idkit/core/bits.hpp"

namespace idkit::core::ulid_codec {

namespace {

// Number of hex digits in a UUID
constexpr std::size_t kUuidHexLength = 32;

// The first Base32 character may not exceed '7'; anything larger needs
// more than 48 bits of timestamp
constexpr int kMaxLeadingIndex = 7;

std::string formatUuid(const std::string& hex) {
  return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
         hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

}  // namespace

std::string encode(std::uint64_t timestamp_ms, RandomSource& rng) {
  std::uint64_t value = timestamp_ms & kMaxTimestamp;

  std::string result;
  result.reserve(kUlidLength);

  // Least significant digit first, reversed below
  for (std::size_t i = 0; i < kTimestampLength; ++i) {
    std::uint64_t digit = value % 32;
    result += bits::base32Char(static_cast<int>(digit));
    value = (value - digit) / 32;
  }
  std::reverse(result.begin(), result.end());

  for (std::size_t i = 0; i < kRandomnessLength; ++i) {
    result += bits::base32Char(rng.nextInt(0, 31));
  }

  return result;
}

bool isValidFormat(std::string_view str) noexcept {
  if (str.length() != kUlidLength) {
    return false;
  }

  // Check each character is valid base32
  for (char c : str) {
    if (bits::base32Index(c) < 0) {
      return false;
    }
  }

  return bits::base32Index(str.front()) <= kMaxLeadingIndex;
}

std::uint64_t decodeTimestamp(std::string_view ulid) {
  bits::Bits stream;
  stream.reserve(kTimestampLength * 5);

  for (char c : ulid.substr(0, kTimestampLength)) {
    auto digit = bits::base32ToBits(c);
    stream.insert(stream.end(), digit.begin(), digit.end());
  }

  return bits::bitsToInt(stream.size(), stream);
}

std::string toUuidString(std::string_view ulid) {
  if (!isValidFormat(ulid)) {
    return {};
  }

  bits::Bits stream;
  stream.reserve(kUlidLength * 5);
  for (char c : ulid) {
    auto digit = bits::base32ToBits(c);
    stream.insert(stream.end(), digit.begin(), digit.end());
  }

  // 130 bits regroup into 33 nibbles; the first only holds padding and
  // the two top timestamp bits, which are always zero for a valid ULID
  auto nibbles = bits::bitsToBaseN(4, stream);

  std::string hex;
  hex.reserve(kUuidHexLength);
  for (std::size_t i = 1; i < nibbles.size(); ++i) {
    hex += bits::kHexDigits[static_cast<std::size_t>(nibbles[i])];
  }

  return formatUuid(hex);
}

std::optional<std::string> fromUuidString(std::string_view uuid) {
  bits::Bits stream;
  stream.reserve(kUuidHexLength * 4);

  for (char c : uuid) {
    if (c == '-') {
      continue;
    }
    auto nibble = bits::hexToBits(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    if (nibble.empty()) {
      spdlog::debug("Rejecting UUID '{}': non-hex character", uuid);
      return std::nullopt;
    }
    stream.insert(stream.end(), nibble.begin(), nibble.end());
  }

  std::string result;
  for (int group : bits::bitsToBaseN(5, stream)) {
    result += bits::base32Char(group);
  }

  if (!isValidFormat(result)) {
    spdlog::debug("Rejecting UUID '{}': does not map to a valid ULID", uuid);
    return std::nullopt;
  }

  return result;
}

}  // namespace idkit::core::ulid_codec
