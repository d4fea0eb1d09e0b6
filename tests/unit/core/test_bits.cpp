#include <gtest/gtest.h>

#include "idkit/core/bits.hpp"

using namespace idkit::core::bits;

TEST(BitsTest, HexToBitsIsBigEndian) {
  EXPECT_EQ(hexToBits('0'), (Bits{false, false, false, false}));
  EXPECT_EQ(hexToBits('5'), (Bits{false, true, false, true}));
  EXPECT_EQ(hexToBits('A'), (Bits{true, false, true, false}));
  EXPECT_EQ(hexToBits('f'), (Bits{true, true, true, true}));
}

TEST(BitsTest, HexToBitsRejectsNonHex) {
  EXPECT_TRUE(hexToBits('G').empty());
  EXPECT_TRUE(hexToBits('-').empty());
}

TEST(BitsTest, Base32ToBitsReusesHexWithLeadingZero) {
  EXPECT_EQ(base32ToBits('7'), (Bits{false, false, true, true, true}));
  EXPECT_EQ(base32ToBits('F'), (Bits{false, true, true, true, true}));
}

TEST(BitsTest, Base32ToBitsUsesLetterTable) {
  EXPECT_EQ(base32ToBits('G'), (Bits{true, false, false, false, false}));
  EXPECT_EQ(base32ToBits('Z'), (Bits{true, true, true, true, true}));
  EXPECT_EQ(bitsToInt(5, base32ToBits('M')), 20u);
}

TEST(BitsTest, Base32ToBitsRejectsExcludedLetters) {
  for (char c : {'I', 'L', 'O', 'U', 'a', '*'}) {
    EXPECT_TRUE(base32ToBits(c).empty()) << c;
  }
}

TEST(BitsTest, EveryAlphabetCharacterMapsToItsIndex) {
  for (std::size_t i = 0; i < kBase32Alphabet.size(); ++i) {
    char c = kBase32Alphabet[i];
    EXPECT_EQ(bitsToInt(5, base32ToBits(c)), i) << c;
    EXPECT_EQ(base32Index(c), static_cast<int>(i));
    EXPECT_EQ(base32Char(static_cast<int>(i)), c);
  }
  EXPECT_EQ(base32Index('U'), -1);
}

TEST(BitsTest, BitsToBaseNPadsOnTheLeft) {
  // 101 -> 0101 -> one group of 5
  EXPECT_EQ(bitsToBaseN(4, Bits{true, false, true}), std::vector<int>{5});

  // 6 bits into groups of 4: 00|110011 -> 0011, 0011
  Bits six{true, true, false, false, true, true};
  EXPECT_EQ(bitsToBaseN(4, six), (std::vector<int>{3, 3}));
}

TEST(BitsTest, BitsToBaseNEdgeCases) {
  EXPECT_TRUE(bitsToBaseN(4, Bits{}).empty());
  EXPECT_TRUE(bitsToBaseN(0, Bits{true}).empty());
}

TEST(BitsTest, BitsToIntUsesPositionalWeights) {
  EXPECT_EQ(bitsToInt(4, Bits{true, false, false, true}), 9u);
  EXPECT_EQ(bitsToInt(1, Bits{true}), 1u);
  EXPECT_EQ(bitsToInt(3, Bits{}), 0u);
}
