#include <gtest/gtest.h>

#include <set>
#include <string>
#include <vector>

#include "idkit/core/uuid.hpp"
#include "test_helpers.hpp"

using namespace idkit::core;
using namespace idkit::test;

TEST(UuidTest, ConsumesThirtyOneHexDraws) {
  SequenceRandomSource rng({0});
  Uuid::generate(rng);

  EXPECT_EQ(rng.drawCount(), 31u);
  EXPECT_EQ(rng.lastLow(), 0);
  EXPECT_EQ(rng.lastHigh(), 15);
}

TEST(UuidTest, FixedVersionAndVariant) {
  SequenceRandomSource zeros({0});
  EXPECT_EQ(Uuid::generate(zeros), "00000000-0000-4000-8000-000000000000");

  SequenceRandomSource fifteens({15});
  EXPECT_EQ(Uuid::generate(fifteens), "ffffffff-ffff-4fff-bfff-ffffffffffff");
}

TEST(UuidTest, DrawsFillPositionsInOrder) {
  std::vector<int> draws;
  for (int i = 0; i < 31; ++i) {
    draws.push_back(i % 16);
  }
  SequenceRandomSource rng(draws);

  // Draw 15 is 15 -> (15 & 3) | 8 = 0xb
  EXPECT_EQ(Uuid::generate(rng), "01234567-89ab-4cde-b012-3456789abcde");
}

TEST(UuidTest, VariantNibbleAlwaysInRange) {
  for (int d = 0; d < 16; ++d) {
    std::vector<int> draws(31, 0);
    draws[15] = d;
    SequenceRandomSource rng(draws);
    auto uuid = Uuid::generate(rng);
    EXPECT_NE(std::string("89ab").find(uuid[19]), std::string::npos) << uuid;
  }
}

TEST(UuidTest, GeneratedValuesAreValid) {
  std::set<std::string> seen;
  for (int i = 0; i < 100; ++i) {
    auto uuid = Uuid::generate();
    EXPECT_EQ(uuid.size(), 36u);
    EXPECT_TRUE(Uuid::isValid(uuid)) << uuid;
    seen.insert(uuid);
  }
  EXPECT_EQ(seen.size(), 100u);
}

TEST(UuidTest, SeededSourceIsReproducible) {
  Mt19937RandomSource a(42);
  Mt19937RandomSource b(42);
  EXPECT_EQ(Uuid::generate(a), Uuid::generate(b));
}

TEST(UuidTest, IsValidAcceptsCanonicalForms) {
  EXPECT_TRUE(Uuid::isValid("123e4567-e89b-42d3-a456-426614174000"));
  EXPECT_TRUE(Uuid::isValid("123E4567-E89B-12D3-B456-426614174000"));
  EXPECT_TRUE(Uuid::isValid("00000000-0000-5000-8000-000000000000"));
}

TEST(UuidTest, IsValidRejectsOtherForms) {
  EXPECT_FALSE(Uuid::isValid(""));
  EXPECT_FALSE(Uuid::isValid("123e4567e89b42d3a456426614174000"));
  EXPECT_FALSE(Uuid::isValid("123e4567-e89b-62d3-a456-426614174000"));  // version 6
  EXPECT_FALSE(Uuid::isValid("123e4567-e89b-02d3-a456-426614174000"));  // version 0
  EXPECT_FALSE(Uuid::isValid("123e4567-e89b-42d3-c456-426614174000"));  // variant c
  EXPECT_FALSE(Uuid::isValid("123e4567-e89b-42d3-a456-42661417400"));
  EXPECT_FALSE(Uuid::isValid("123e4567-e89b-42d3-a456-4266141740000"));
  EXPECT_FALSE(Uuid::isValid("g23e4567-e89b-42d3-a456-426614174000"));
  EXPECT_FALSE(Uuid::isValid(" 123e4567-e89b-42d3-a456-426614174000"));
}
