#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "idkit/common.hpp"
#include "idkit/core/random_source.hpp"

namespace idkit::core {

// String-level ULID operations shared by every Ulid<Tag>
namespace ulid_codec {

inline constexpr std::size_t kUlidLength = 26;
inline constexpr std::size_t kTimestampLength = 10;
inline constexpr std::size_t kRandomnessLength = 16;

// Largest timestamp representable in the 48-bit time component
inline constexpr std::uint64_t kMaxTimestamp = (std::uint64_t{1} << 48) - 1;

// Build a ULID from the low 48 bits of `timestamp_ms` and 16 draws from `rng`
std::string encode(std::uint64_t timestamp_ms, RandomSource& rng);

// Length 26, Base32 alphabet only, and a first character below '8'
bool isValidFormat(std::string_view str) noexcept;

// Millisecond timestamp held in the first 10 characters of a valid ULID
std::uint64_t decodeTimestamp(std::string_view ulid);

// Regroup the 130 ULID bits into hex nibbles, dropping the leading one.
// The result has UUID shape only; its version and variant nibbles are
// arbitrary. Empty when `ulid` is not a valid ULID.
std::string toUuidString(std::string_view ulid);

// Inverse regrouping of a hyphenated or bare hex string into Base32.
// std::nullopt on non-hex input or when the result is not a valid ULID.
std::optional<std::string> fromUuidString(std::string_view uuid);

}  // namespace ulid_codec

// ULID (Universally Unique Lexicographically Sortable Identifier)
// 26 characters, base32 encoded, sortable by time.
// `Tag` only separates identifier domains at compile time.
template <typename Tag>
class Ulid {
 public:
  // Create new ULID with current timestamp
  static Ulid generate() { return generate(defaultRandomSource()); }

  static Ulid generate(RandomSource& rng) {
    return generate(std::chrono::system_clock::now(), rng);
  }

  // Create ULID with specific timestamp
  static Ulid generate(std::chrono::system_clock::time_point timestamp,
                       RandomSource& rng) {
    auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()).count();
    return generate(static_cast<std::uint64_t>(milliseconds), rng);
  }

  static Ulid generate(std::uint64_t timestamp_ms, RandomSource& rng) {
    return Ulid(ulid_codec::encode(timestamp_ms, rng));
  }

  // Parse ULID from string; std::nullopt when malformed
  static std::optional<Ulid> parse(std::string_view str) {
    if (!ulid_codec::isValidFormat(str)) {
      return std::nullopt;
    }
    return Ulid(std::string(str));
  }

  // Parse ULID from string, reporting why it was rejected
  static Result<Ulid> fromString(std::string_view str) {
    auto parsed = parse(str);
    if (!parsed) {
      return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                       "Invalid ULID format: " + std::string(str)));
    }
    return *parsed;
  }

  static std::optional<Ulid> fromUuidString(std::string_view uuid) {
    auto converted = ulid_codec::fromUuidString(uuid);
    if (!converted) {
      return std::nullopt;
    }
    return Ulid(std::move(*converted));
  }

  // Default constructor creates invalid ID
  Ulid() = default;

  const std::string& toString() const noexcept { return id_; }

  // Milliseconds since the Unix epoch; 0 for an invalid ID
  std::uint64_t timestampMs() const {
    return isValid() ? ulid_codec::decodeTimestamp(id_) : 0;
  }

  std::chrono::system_clock::time_point timestamp() const {
    return std::chrono::system_clock::time_point{
        std::chrono::milliseconds(static_cast<std::int64_t>(timestampMs()))};
  }

  std::string toUuidString() const { return ulid_codec::toUuidString(id_); }

  bool isValid() const noexcept { return ulid_codec::isValidFormat(id_); }

  bool operator==(const Ulid& other) const noexcept { return id_ == other.id_; }
  bool operator!=(const Ulid& other) const noexcept { return id_ != other.id_; }
  bool operator<(const Ulid& other) const noexcept { return id_ < other.id_; }
  bool operator<=(const Ulid& other) const noexcept { return id_ <= other.id_; }
  bool operator>(const Ulid& other) const noexcept { return id_ > other.id_; }
  bool operator>=(const Ulid& other) const noexcept { return id_ >= other.id_; }

  // Hash support for containers
  struct Hash {
    std::size_t operator()(const Ulid& id) const noexcept {
      return std::hash<std::string>{}(id.id_);
    }
  };

 private:
  explicit Ulid(std::string id) : id_(std::move(id)) {}

  std::string id_;
};

}  // namespace idkit::core

// Hash specialization for std::unordered_map
namespace std {
template <typename Tag>
struct hash<idkit::core::Ulid<Tag>> : idkit::core::Ulid<Tag>::Hash {};
}  // namespace std
