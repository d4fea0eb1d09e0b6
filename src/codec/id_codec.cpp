#include "idkit/codec/id_codec.hpp"

#include <spdlog/spdlog.h>

namespace idkit::codec {

namespace detail {

Result<nlohmann::json> unwrapTagged(std::string_view type_tag, const nlohmann::json& encoded) {
  if (!encoded.is_array() || encoded.size() != 2) {
    return makeErrorResult<nlohmann::json>(ErrorCode::kParseError,
                                           "Expected [tag, value] pair, got: " + encoded.dump());
  }

  if (!encoded[0].is_string()) {
    return makeErrorResult<nlohmann::json>(ErrorCode::kParseError,
                                           "Identifier tag is not a string: " + encoded[0].dump());
  }

  const auto& tag = encoded[0].get_ref<const std::string&>();
  if (tag != type_tag) {
    spdlog::debug("Tag mismatch while decoding identifier: expected '{}', got '{}'", type_tag, tag);
    return makeErrorResult<nlohmann::json>(
        ErrorCode::kWrongIdType,
        "Wrong identifier type: expected '" + std::string(type_tag) + "', got '" + tag + "'");
  }

  return encoded[1];
}

}  // namespace detail

Result<nlohmann::json> parseWire(std::string_view text) {
  auto parsed = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (parsed.is_discarded()) {
    return makeErrorResult<nlohmann::json>(ErrorCode::kParseError,
                                           "Invalid JSON: " + std::string(text));
  }
  return parsed;
}

}  // namespace idkit::codec
