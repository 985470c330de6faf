#include "ft8/ldpc/factor_graph.hpp"
#include "ft8/errors.hpp"
#include <stdexcept>
#include <string>

namespace ft8::ldpc {

FactorGraph::FactorGraph(std::span<const CheckRow> rows) {
    if (rows.size() != kParityBits)
        throw std::logic_error("factor graph: expected " + std::to_string(kParityBits) +
                               " check rows, got " + std::to_string(rows.size()));

    std::array<uint8_t, kCodewordBits> bit_fill{};
    for (size_t c = 0; c < kParityBits; ++c) {
        const CheckRow& row = rows[c];
        if (row.degree < 6 || row.degree > kMaxCheckDegree)
            throw std::logic_error("factor graph: check " + std::to_string(c) +
                                   " has degree " + std::to_string(row.degree));
        check_degree_[c] = row.degree;
        for (uint8_t k = 0; k < row.degree; ++k) {
            uint16_t n = row.bits[k];
            if (n >= kCodewordBits)
                throw std::logic_error("factor graph: check " + std::to_string(c) +
                                       " references bit " + std::to_string(n));
            for (uint8_t j = 0; j < k; ++j)
                if (check_bits_[c][j] == n)
                    throw std::logic_error("factor graph: duplicate edge in check " + std::to_string(c));
            if (bit_fill[n] >= kBitDegree)
                throw std::logic_error("factor graph: bit " + std::to_string(n) +
                                       " is in more than 3 checks");
            uint8_t s = bit_fill[n]++;
            check_bits_[c][k] = n;
            bit_checks_[n][s] = static_cast<uint16_t>(c);
            slot_in_check_[n][s] = k;
            slot_in_bit_[c][k] = s;
            ++edges_;
        }
    }

    for (size_t n = 0; n < kCodewordBits; ++n)
        if (bit_fill[n] != kBitDegree)
            throw std::logic_error("factor graph: bit " + std::to_string(n) + " has degree " +
                                   std::to_string(bit_fill[n]));
    if (edges_ != kEdgeCount)
        throw std::logic_error("factor graph: " + std::to_string(edges_) + " edges, expected " +
                               std::to_string(kEdgeCount));
}

const FactorGraph& FactorGraph::instance() {
    static const FactorGraph graph(kCheckRows);
    return graph;
}

size_t FactorGraph::unsatisfied(std::span<const uint8_t> codeword) const {
    require_length("parity check codeword", codeword.size(), kCodewordBits);
    size_t errors = 0;
    for (size_t c = 0; c < kParityBits; ++c) {
        uint8_t x = 0;
        for (uint16_t n : check_bits(c)) x ^= codeword[n] & 1u;
        if (x) ++errors;
    }
    return errors;
}

} // namespace ft8::ldpc
