#include <gtest/gtest.h>
#include "ft8/constants.hpp"
#include "ft8/errors.hpp"
#include "ft8/tx/frame_tx.hpp"
#include "ft8/utils/crc.hpp"
#include "test_util.hpp"
#include <string>
#include <vector>

using namespace ft8;

static std::string tone_string(const std::vector<uint8_t>& tones) {
    std::string s;
    for (auto t : tones) s += static_cast<char>('0' + t);
    return s;
}

TEST(FrameTx, KnownToneSequences) {
    EXPECT_EQ(tone_string(tx::encode_message(hex_bits("1a2b3c4d5e6f7081928", kMessageBits))),
              "3140652023134241163754764050211306223140652310101505611430361226735577153140652");
    EXPECT_EQ(tone_string(tx::encode_message(hex_bits("1", kMessageBits))),
              "3140652000000000000000000000000024073140652322741426260437212641341535253140652");
    EXPECT_EQ(tone_string(tx::encode_message(hex_bits("1fffffffffffffffffff", kMessageBits))),
              "3140652777777777777777777777777741723140652077662375644114265771532717363140652");
}

TEST(FrameTx, CostasArraysAtFixedOffsets) {
    std::mt19937 rng(21);
    auto tones = tx::encode_message(random_bits(rng, kMessageBits));
    ASSERT_EQ(tones.size(), kFrameSymbols);
    for (size_t off : kCostasOffsets)
        for (size_t k = 0; k < kCostas.size(); ++k)
            EXPECT_EQ(tones[off + k], kCostas[k]);
    for (auto t : tones) EXPECT_LT(t, kToneCount);
}

TEST(FrameTx, DataSymbolOffsets) {
    EXPECT_EQ(kDataSymbolOffsets.front(), 7u);
    EXPECT_EQ(kDataSymbolOffsets[28], 35u);
    EXPECT_EQ(kDataSymbolOffsets[29], 43u);
    EXPECT_EQ(kDataSymbolOffsets.back(), 71u);
}

TEST(FrameTx, BlockCarriesValidCrc) {
    std::mt19937 rng(22);
    auto msg = random_bits(rng, kMessageBits);
    auto block = tx::encode_block(msg);
    ASSERT_EQ(block.size(), kBlockBits);
    EXPECT_TRUE(utils::Crc14{}.verify(block));
}

TEST(FrameTx, RejectsWrongLengths) {
    std::vector<uint8_t> msg(kBlockBits, 0);
    EXPECT_THROW(tx::encode_message(msg), InvalidLength);
    std::vector<uint8_t> data(57, 0);
    EXPECT_THROW(tx::assemble_frame(data), InvalidLength);
}
