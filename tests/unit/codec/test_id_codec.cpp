#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "idkit/codec/id_codec.hpp"
#include "test_helpers.hpp"

using namespace idkit;
using namespace idkit::core;
using namespace idkit::test;
using nlohmann::json;

namespace {

struct UserTag {};
struct OrderTag {};

}  // namespace

class IdCodecTest : public ::testing::Test {};

TEST_F(IdCodecTest, EncodeIdPairsTagWithValue) {
  auto encoded = codec::encodeId("user", Id<UserTag>(42));
  EXPECT_EQ(encoded, json::array({"user", 42}));
  EXPECT_EQ(encoded.dump(), R"(["user",42])");
}

TEST_F(IdCodecTest, EncodeUlidPairsTagWithString) {
  auto ulid = Ulid<UserTag>::parse("01AN4Z07BY79KA1307SR9X4MV3");
  ASSERT_TRUE(ulid.has_value());
  EXPECT_EQ(codec::encodeUlid("user", *ulid), json::array({"user", "01AN4Z07BY79KA1307SR9X4MV3"}));
}

TEST_F(IdCodecTest, DecodeIdWithMatchingTag) {
  auto decoded = codec::decodeId<UserTag>("user", json::array({"user", 7}));
  ASSERT_OK(decoded);
  EXPECT_EQ(*decoded, Id<UserTag>(7));
}

TEST_F(IdCodecTest, DecodeIdWithWrongTag) {
  auto decoded = codec::decodeId<UserTag>("user", json::array({"order", 7}));
  EXPECT_ERROR(decoded, ErrorCode::kWrongIdType);
  EXPECT_NE(decoded.error().message().find("order"), std::string::npos);
}

TEST_F(IdCodecTest, DecodeIdRejectsBadValues) {
  EXPECT_ERROR(codec::decodeId<UserTag>("user", json::array({"user", "7"})), ErrorCode::kParseError);
  EXPECT_ERROR(codec::decodeId<UserTag>("user", json::array({"user", 1.5})), ErrorCode::kParseError);
  EXPECT_ERROR(codec::decodeId<UserTag>("user", json::array({"user", -1})), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(codec::decodeId<UserTag>("user", json::array({"user", 18446744073709551615ull})),
               ErrorCode::kInvalidArgument);
}

TEST_F(IdCodecTest, DecodeRejectsWrongShape) {
  EXPECT_ERROR(codec::decodeId<UserTag>("user", json(7)), ErrorCode::kParseError);
  EXPECT_ERROR(codec::decodeId<UserTag>("user", json::array({"user"})), ErrorCode::kParseError);
  EXPECT_ERROR(codec::decodeId<UserTag>("user", json::array({"user", 1, 2})), ErrorCode::kParseError);
  EXPECT_ERROR(codec::decodeId<UserTag>("user", json::array({3, 1})), ErrorCode::kParseError);
}

TEST_F(IdCodecTest, DecodeUlid) {
  auto ok = codec::decodeUlid<UserTag>("user", json::array({"user", "01AN4Z07BY79KA1307SR9X4MV3"}));
  ASSERT_OK(ok);
  EXPECT_EQ(ok->toString(), "01AN4Z07BY79KA1307SR9X4MV3");

  EXPECT_ERROR(codec::decodeUlid<UserTag>("user", json::array({"order", "01AN4Z07BY79KA1307SR9X4MV3"})),
               ErrorCode::kWrongIdType);
  EXPECT_ERROR(codec::decodeUlid<UserTag>("user", json::array({"user", "not-a-ulid"})),
               ErrorCode::kInvalidArgument);
  EXPECT_ERROR(codec::decodeUlid<UserTag>("user", json::array({"user", 12})), ErrorCode::kParseError);
}

TEST_F(IdCodecTest, ParseWire) {
  auto wire = codec::parseWire(R"(["user", 7])");
  ASSERT_OK(wire);
  EXPECT_EQ(*wire, json::array({"user", 7}));

  EXPECT_ERROR(codec::parseWire("[\"user\", "), ErrorCode::kParseError);
  EXPECT_ERROR(codec::parseWire(""), ErrorCode::kParseError);
}

TEST_F(IdCodecTest, BoundCodecsCheckTheirTag) {
  codec::IdCodec<UserTag> users("user");
  codec::IdCodec<OrderTag> orders("order");
  EXPECT_EQ(users.typeTag(), "user");

  auto wire = users.encode(Id<UserTag>(3));
  ASSERT_OK(users.decode(wire));
  EXPECT_EQ(*users.decode(wire), Id<UserTag>(3));
  EXPECT_ERROR(orders.decode(wire), ErrorCode::kWrongIdType);

  codec::UlidCodec<UserTag> user_ulids("user-ulid");
  auto ulid = Ulid<UserTag>::generate();
  auto decoded = user_ulids.decode(user_ulids.encode(ulid));
  ASSERT_OK(decoded);
  EXPECT_EQ(*decoded, ulid);
  EXPECT_ERROR(user_ulids.decode(users.encode(Id<UserTag>(3))), ErrorCode::kWrongIdType);
}
