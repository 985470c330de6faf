#include <gtest/gtest.h>
#include "ft8/constants.hpp"
#include "ft8/errors.hpp"
#include "ft8/ldpc/encoder.hpp"
#include "ft8/utils/bit_packing.hpp"
#include "ft8/utils/crc.hpp"
#include "test_util.hpp"
#include <algorithm>
#include <random>

using namespace ft8;

TEST(LdpcEncoder, ZeroBlockGivesZeroCodeword) {
    std::vector<uint8_t> block(kBlockBits, 0);
    auto cw = ldpc::encode(block);
    ASSERT_EQ(cw.size(), kCodewordBits);
    EXPECT_TRUE(std::all_of(cw.begin(), cw.end(), [](uint8_t b) { return b == 0; }));
}

TEST(LdpcEncoder, KnownCodeword) {
    utils::Crc14 crc;
    auto block = crc.append(hex_bits("1a2b3c4d5e6f7081928", kMessageBits));
    auto cw = ldpc::encode(block);
    EXPECT_EQ(utils::bits_to_hex(cw), "03456789abcdee103250ada208304a4e4152ddea4fcc");
}

TEST(LdpcEncoder, SystematicAndParitySatisfied) {
    std::mt19937 rng(42);
    for (int t = 0; t < 200; ++t) {
        auto block = random_bits(rng, kBlockBits);
        auto cw = ldpc::encode(block);
        ASSERT_EQ(cw.size(), kCodewordBits);
        EXPECT_TRUE(std::equal(block.begin(), block.end(), cw.begin()));
        EXPECT_EQ(ldpc::parity_failures(cw), 0u);
        EXPECT_TRUE(ldpc::is_codeword(cw));
    }
}

TEST(LdpcEncoder, SingleBitErrorBreaksThreeChecks) {
    std::mt19937 rng(5);
    auto cw = ldpc::encode(random_bits(rng, kBlockBits));
    for (size_t i = 0; i < kCodewordBits; i += 13) {
        cw[i] ^= 1;
        EXPECT_EQ(ldpc::parity_failures(cw), 3u) << "bit " << i;
        cw[i] ^= 1;
    }
}

TEST(LdpcEncoder, RejectsWrongLength) {
    std::vector<uint8_t> block(kMessageBits, 0);
    EXPECT_THROW(ldpc::encode(block), InvalidLength);
    std::vector<uint8_t> longer(kCodewordBits, 0);
    EXPECT_THROW(ldpc::encode(longer), InvalidLength);
}
