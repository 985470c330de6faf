#include <gtest/gtest.h>
#include "ft8/constants.hpp"
#include "ft8/errors.hpp"
#include "ft8/ldpc/factor_graph.hpp"
#include "ft8/ldpc/tables.hpp"
#include <array>
#include <stdexcept>
#include <vector>

using namespace ft8;
using namespace ft8::ldpc;

TEST(FactorGraph, Structure) {
    const auto& g = FactorGraph::instance();
    EXPECT_EQ(g.edge_count(), 522u);

    size_t deg6 = 0, deg7 = 0, sum = 0;
    for (size_t c = 0; c < kParityBits; ++c) {
        size_t d = g.check_degree(c);
        EXPECT_TRUE(d == 6 || d == 7) << "check " << c;
        (d == 6 ? deg6 : deg7)++;
        sum += d;
    }
    EXPECT_EQ(sum, kEdgeCount);
    EXPECT_GT(deg6, 0u);
    EXPECT_GT(deg7, 0u);
}

TEST(FactorGraph, EdgeSlotsAreMutualInverses) {
    const auto& g = FactorGraph::instance();
    for (size_t n = 0; n < kCodewordBits; ++n) {
        auto checks = g.bit_checks(n);
        EXPECT_NE(checks[0], checks[1]);
        EXPECT_NE(checks[1], checks[2]);
        EXPECT_NE(checks[0], checks[2]);
        for (size_t s = 0; s < kBitDegree; ++s) {
            size_t c = checks[s];
            uint8_t k = g.slot_in_check(n, s);
            ASSERT_LT(k, g.check_degree(c));
            EXPECT_EQ(g.check_bits(c)[k], n);
            EXPECT_EQ(g.slot_in_bit(c, k), s);
        }
    }
}

TEST(FactorGraph, MatchesReferenceRows) {
    const auto& g = FactorGraph::instance();
    // First and last reference equations.
    std::vector<uint16_t> first = {3, 30, 58, 90, 91, 95, 152};
    std::vector<uint16_t> last  = {16, 41, 74, 128, 169, 171};
    auto c0 = g.check_bits(0);
    auto c82 = g.check_bits(82);
    EXPECT_EQ(std::vector<uint16_t>(c0.begin(), c0.end()), first);
    EXPECT_EQ(std::vector<uint16_t>(c82.begin(), c82.end()), last);
}

TEST(FactorGraph, UnsatisfiedCountsFlippedBit) {
    const auto& g = FactorGraph::instance();
    std::vector<uint8_t> cw(kCodewordBits, 0);
    EXPECT_EQ(g.unsatisfied(cw), 0u);
    cw[100] = 1;
    EXPECT_EQ(g.unsatisfied(cw), 3u);
    std::vector<uint8_t> short_cw(100, 0);
    EXPECT_THROW(g.unsatisfied(short_cw), InvalidLength);
}

TEST(FactorGraph, RejectsMalformedTables) {
    std::array<CheckRow, kParityBits> rows = kCheckRows;
    EXPECT_NO_THROW(FactorGraph{rows});

    auto bad_index = rows;
    bad_index[0].bits[0] = 174;
    EXPECT_THROW(FactorGraph{bad_index}, std::logic_error);

    auto bad_degree = rows;
    bad_degree[5].degree = 5;
    EXPECT_THROW(FactorGraph{bad_degree}, std::logic_error);

    auto dup = rows;
    dup[0].bits[1] = dup[0].bits[0];
    EXPECT_THROW(FactorGraph{dup}, std::logic_error);

    std::vector<CheckRow> too_few(rows.begin(), rows.end() - 1);
    EXPECT_THROW(FactorGraph{too_few}, std::logic_error);
}
