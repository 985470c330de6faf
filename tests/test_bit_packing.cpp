#include <gtest/gtest.h>
#include "ft8/utils/bit_packing.hpp"
#include <vector>

using namespace ft8::utils;

TEST(BitPacking, MsbFirstRoundTrip) {
    std::vector<uint8_t> bits = {1, 0, 1, 1, 0, 0, 0, 1, 1, 1};
    auto bytes = pack_bits_msb_first(bits);
    ASSERT_EQ(bytes.size(), 2u);
    EXPECT_EQ(bytes[0], 0xB1);
    EXPECT_EQ(bytes[1], 0xC0);
    EXPECT_EQ(unpack_bits_msb_first(bytes, bits.size()), bits);
}

TEST(BitPacking, ParseHexRightAligned) {
    auto bits = parse_bits("0x5", 6);
    EXPECT_EQ(bits, (std::vector<uint8_t>{0, 0, 0, 1, 0, 1}));
    EXPECT_EQ(bits_to_hex(bits), "05");
    EXPECT_EQ(parse_bits("1fffffffffffffffffff", 77).size(), 77u);
    EXPECT_EQ(bits_to_hex(parse_bits("1a2b3c4d5e6f7081928", 77)), "01a2b3c4d5e6f7081928");
}

TEST(BitPacking, ParseBitString) {
    auto bits = parse_bits("0110", 4);
    EXPECT_EQ(bits, (std::vector<uint8_t>{0, 1, 1, 0}));
}

TEST(BitPacking, RejectsMalformedInput) {
    EXPECT_TRUE(parse_bits("xyz", 8).empty());
    EXPECT_TRUE(parse_bits("3fffffffffffffffffff", 77).empty()); // 78 bits
    EXPECT_TRUE(parse_bits("", 8).empty());
}
