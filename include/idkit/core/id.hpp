#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>

namespace idkit::core {

// Integer handle for one identifier domain. `Tag` is an empty marker
// struct; Id<UserTag> and Id<DocumentTag> share a representation but do
// not convert into each other.
template <typename Tag>
class Id {
 public:
  using value_type = std::int64_t;

  Id() = default;
  explicit constexpr Id(value_type value) noexcept : value_(value) {}

  // Reject negative values, which are never allocated
  static std::optional<Id> fromValue(value_type value) noexcept {
    if (value < 0) {
      return std::nullopt;
    }
    return Id(value);
  }

  constexpr value_type value() const noexcept { return value_; }

  // The identifier allocated after this one
  constexpr Id next() const noexcept { return Id(value_ + 1); }

  constexpr bool operator==(const Id& other) const noexcept { return value_ == other.value_; }
  constexpr bool operator!=(const Id& other) const noexcept { return value_ != other.value_; }
  constexpr bool operator<(const Id& other) const noexcept { return value_ < other.value_; }
  constexpr bool operator<=(const Id& other) const noexcept { return value_ <= other.value_; }
  constexpr bool operator>(const Id& other) const noexcept { return value_ > other.value_; }
  constexpr bool operator>=(const Id& other) const noexcept { return value_ >= other.value_; }

  // Hash support for containers
  struct Hash {
    std::size_t operator()(const Id& id) const noexcept {
      return std::hash<value_type>{}(id.value_);
    }
  };

 private:
  value_type value_ = 0;
};

}  // namespace idkit::core

// Hash specialization for std::unordered_map
namespace std {
template <typename Tag>
struct hash<idkit::core::Id<Tag>> : idkit::core::Id<Tag>::Hash {};
}  // namespace std
