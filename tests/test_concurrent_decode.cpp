#include <gtest/gtest.h>
#include "ft8/constants.hpp"
#include "ft8/ldpc/bp_decoder.hpp"
#include "ft8/ldpc/factor_graph.hpp"
#include "ft8/tx/frame_tx.hpp"
#include "test_util.hpp"
#include <atomic>
#include <random>
#include <thread>
#include <vector>

using namespace ft8;

TEST(ConcurrentDecode, SharedDecoderManyThreads) {
    const ldpc::BpDecoder dec;
    const int threads = 8, per_thread = 20;
    std::atomic<int> ok{0}, mismatched{0};
    std::atomic<const ldpc::FactorGraph*> graph{nullptr};

    std::vector<std::thread> pool;
    for (int t = 0; t < threads; ++t) {
        pool.emplace_back([&, t] {
            std::mt19937 rng(1000 + t);
            std::normal_distribution<float> noise(0.0f, 0.5f);
            const ldpc::FactorGraph* g = &ldpc::FactorGraph::instance();
            const ldpc::FactorGraph* expected = nullptr;
            if (!graph.compare_exchange_strong(expected, g) && expected != g) ++mismatched;
            for (int i = 0; i < per_thread; ++i) {
                auto cw = tx::encode_codeword(random_bits(rng, kMessageBits));
                auto llr = strong_llr(cw, 4.0f);
                for (auto& v : llr) v += noise(rng);
                auto res = dec.decode(llr);
                if (res.ok() && res.codeword == cw) ++ok;
            }
        });
    }
    for (auto& th : pool) th.join();

    EXPECT_EQ(mismatched.load(), 0);
    EXPECT_EQ(ok.load(), threads * per_thread);
}
