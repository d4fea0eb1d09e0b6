#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace idkit::core::bits {

// Big-endian bit sequence, most significant bit first
using Bits = std::vector<bool>;

// Crockford's Base32 (no I, L, O, U)
inline constexpr std::string_view kBase32Alphabet = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";
inline constexpr std::string_view kHexDigits = "0123456789abcdef";

// Map one hex digit (either case) to its 4 bits; empty for non-hex input
Bits hexToBits(char c);

// Map one Base32 character to its 5 bits; empty for characters outside the alphabet
Bits base32ToBits(char c);

// Left-pad `bits` with zeros to a multiple of `n`, then convert each
// group of `n` bits to its integer value
std::vector<int> bitsToBaseN(std::size_t n, const Bits& bits);

// Interpret the first `width` bits as a big-endian unsigned integer
std::uint64_t bitsToInt(std::size_t width, const Bits& bits);

// Position of `c` in the Base32 alphabet, or -1
int base32Index(char c) noexcept;

// Base32 character for a 5-bit value; `value` must be in [0, 31]
char base32Char(int value) noexcept;

}  // namespace idkit::core::bits
