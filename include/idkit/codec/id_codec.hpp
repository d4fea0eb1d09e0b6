#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

#include "idkit/common.hpp"
#include "idkit/core/id.hpp"
#include "idkit/core/ulid.hpp"

namespace idkit::codec {

/**
 * @brief Tagged wire form of typed identifiers
 *
 * The compile-time domain of Id<Tag> and Ulid<Tag> does not survive
 * serialization. Each value is therefore written as a two element array
 * `[type_tag, raw]`, where raw is an integer for Id and a string for Ulid.
 * Decoding with a different tag fails with ErrorCode::kWrongIdType.
 */

namespace detail {

// Check the `[tag, raw]` shape and the tag, returning `raw`
Result<nlohmann::json> unwrapTagged(std::string_view type_tag, const nlohmann::json& encoded);

}  // namespace detail

// Parse wire text into JSON without throwing
Result<nlohmann::json> parseWire(std::string_view text);

template <typename Tag>
nlohmann::json encodeId(std::string_view type_tag, core::Id<Tag> id) {
  return nlohmann::json::array({std::string(type_tag), id.value()});
}

template <typename Tag>
nlohmann::json encodeUlid(std::string_view type_tag, const core::Ulid<Tag>& id) {
  return nlohmann::json::array({std::string(type_tag), id.toString()});
}

template <typename Tag>
Result<core::Id<Tag>> decodeId(std::string_view type_tag, const nlohmann::json& encoded) {
  auto raw = detail::unwrapTagged(type_tag, encoded);
  if (!raw.has_value()) {
    return std::unexpected(raw.error());
  }

  if (!raw->is_number_integer()) {
    return makeErrorResult<core::Id<Tag>>(ErrorCode::kParseError,
                                          "Identifier value is not an integer: " + raw->dump());
  }
  if (raw->is_number_unsigned() &&
      raw->get<std::uint64_t>() >
          static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
    return makeErrorResult<core::Id<Tag>>(ErrorCode::kInvalidArgument,
                                          "Identifier value out of range: " + raw->dump());
  }

  auto id = core::Id<Tag>::fromValue(raw->get<std::int64_t>());
  if (!id) {
    return makeErrorResult<core::Id<Tag>>(ErrorCode::kInvalidArgument,
                                          "Identifier value is negative: " + raw->dump());
  }
  return *id;
}

template <typename Tag>
Result<core::Ulid<Tag>> decodeUlid(std::string_view type_tag, const nlohmann::json& encoded) {
  auto raw = detail::unwrapTagged(type_tag, encoded);
  if (!raw.has_value()) {
    return std::unexpected(raw.error());
  }

  if (!raw->is_string()) {
    return makeErrorResult<core::Ulid<Tag>>(ErrorCode::kParseError,
                                            "ULID value is not a string: " + raw->dump());
  }
  return core::Ulid<Tag>::fromString(raw->get<std::string>());
}

// Binds a type tag to Id<Tag> once
template <typename Tag>
class IdCodec {
 public:
  explicit IdCodec(std::string type_tag) : type_tag_(std::move(type_tag)) {}

  const std::string& typeTag() const noexcept { return type_tag_; }

  nlohmann::json encode(core::Id<Tag> id) const { return encodeId(type_tag_, id); }

  Result<core::Id<Tag>> decode(const nlohmann::json& encoded) const {
    return decodeId<Tag>(type_tag_, encoded);
  }

 private:
  std::string type_tag_;
};

// Binds a type tag to Ulid<Tag> once
template <typename Tag>
class UlidCodec {
 public:
  explicit UlidCodec(std::string type_tag) : type_tag_(std::move(type_tag)) {}

  const std::string& typeTag() const noexcept { return type_tag_; }

  nlohmann::json encode(const core::Ulid<Tag>& id) const { return encodeUlid(type_tag_, id); }

  Result<core::Ulid<Tag>> decode(const nlohmann::json& encoded) const {
    return decodeUlid<Tag>(type_tag_, encoded);
  }

 private:
  std::string type_tag_;
};

}  // namespace idkit::codec
