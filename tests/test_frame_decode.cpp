#include <gtest/gtest.h>
#include "ft8/constants.hpp"
#include "ft8/debug.hpp"
#include "ft8/errors.hpp"
#include "ft8/rx/demap.hpp"
#include "ft8/rx/frame_decode.hpp"
#include "ft8/tx/frame_tx.hpp"
#include "test_util.hpp"
#include <random>
#include <stdexcept>

using namespace ft8;
using namespace ft8::rx;

TEST(Demap, SignsFollowCodewordAtEveryDepth) {
    std::mt19937 rng(31);
    auto msg = random_bits(rng, kMessageBits);
    auto cw = tx::encode_codeword(msg);
    auto obs = tone_observations(tx::encode_message(msg));
    for (int depth = 1; depth <= 3; ++depth) {
        auto llr = demap(obs, depth);
        ASSERT_EQ(llr.size(), kCodewordBits);
        for (size_t n = 0; n < kCodewordBits; ++n)
            EXPECT_EQ(llr[n] > 0.0f, cw[n] == 1) << "depth " << depth << " bit " << n;
    }
}

TEST(Demap, RejectsBadArguments) {
    std::vector<std::complex<float>> obs(kFrameSymbols * kToneCount);
    EXPECT_THROW(demap(obs, 0), std::invalid_argument);
    EXPECT_THROW(demap(obs, 4), std::invalid_argument);
    std::vector<std::complex<float>> short_obs(kDataSymbols * kToneCount);
    EXPECT_THROW(demap(short_obs, 1), InvalidLength);
}

TEST(Demap, HardTonesAndCostas) {
    std::mt19937 rng(32);
    auto tones = tx::encode_message(random_bits(rng, kMessageBits));
    auto obs = tone_observations(tones);
    EXPECT_EQ(hard_tones(obs), tones);
    EXPECT_EQ(count_costas_matches(obs), kCostasSymbols);
}

TEST(FrameDecoder, IdealObservations) {
    std::mt19937 rng(33);
    FrameDecoder dec;
    for (int t = 0; t < 10; ++t) {
        auto msg = random_bits(rng, kMessageBits);
        auto res = dec.decode(tone_observations(tx::encode_message(msg)));
        ASSERT_TRUE(res.ok());
        EXPECT_EQ(res.message, msg);
        EXPECT_EQ(res.depth, 1);
        EXPECT_EQ(res.costas_matches, static_cast<int>(kCostasSymbols));
    }
}

TEST(FrameDecoder, NoisyObservations) {
    std::mt19937 rng(34);
    FrameDecoder dec;
    for (int t = 0; t < 10; ++t) {
        auto msg = random_bits(rng, kMessageBits);
        auto obs = tone_observations(tx::encode_message(msg), &rng, 0.25f);
        auto res = dec.decode(obs);
        ASSERT_TRUE(res.ok());
        EXPECT_EQ(res.message, msg);
    }
}

TEST(FrameDecoder, RejectsMissingSync) {
    std::vector<std::complex<float>> obs(kFrameSymbols * kToneCount);
    auto res = FrameDecoder{}.decode(obs);
    EXPECT_EQ(res.status, FrameStatus::SyncRejected);
    EXPECT_LT(res.costas_matches, 7);
    EXPECT_EQ(debug::last_fail_step, debug::kFailSync);
}

TEST(FrameDecoder, GarbledDataFails) {
    std::mt19937 rng(35);
    auto tones = tx::encode_message(random_bits(rng, kMessageBits));
    std::uniform_int_distribution<int> tone(0, 7);
    for (size_t off : kDataSymbolOffsets) tones[off] = static_cast<uint8_t>(tone(rng));

    FrameDecoderConfig cfg;
    cfg.bp.max_iterations = 50;
    auto res = FrameDecoder(cfg).decode(tone_observations(tones));
    EXPECT_EQ(res.status, FrameStatus::DecodeFailed);
    EXPECT_EQ(res.depth, 3);
    EXPECT_FALSE(res.ldpc.ok());
}

TEST(FrameDecoder, RejectsBadConfig) {
    FrameDecoderConfig cfg;
    cfg.max_demap_depth = 4;
    EXPECT_THROW(FrameDecoder{cfg}, std::invalid_argument);
}
