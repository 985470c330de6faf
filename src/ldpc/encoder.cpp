#include "ft8/ldpc/encoder.hpp"
#include "ft8/constants.hpp"
#include "ft8/errors.hpp"
#include "ft8/ldpc/factor_graph.hpp"
#include "ft8/ldpc/tables.hpp"
#include <array>
#include <cstring>
#include <stdexcept>
#include <string>

#include <liquid/liquid.h>

namespace ft8::ldpc {

namespace {

// 91 block bits in three 32-bit words, bit 0 of the block in the MSB of word 0.
constexpr size_t kWords = 3;
using PackedRow = std::array<uint32_t, kWords>;

PackedRow parse_generator_row(const char* hex) {
    PackedRow row{};
    size_t len = std::strlen(hex);
    if (len * 4 < kBlockBits)
        throw std::logic_error(std::string("generator row too short: ") + hex);
    for (size_t d = 0; d < len; ++d) {
        char c = hex[d];
        uint32_t v;
        if (c >= '0' && c <= '9')      v = static_cast<uint32_t>(c - '0');
        else if (c >= 'a' && c <= 'f') v = static_cast<uint32_t>(c - 'a' + 10);
        else throw std::logic_error(std::string("bad generator digit in ") + hex);
        for (int b = 3; b >= 0; --b) {
            size_t col = d * 4 + static_cast<size_t>(3 - b);
            if (col >= kBlockBits) break; // trailing pad bit
            if ((v >> b) & 1u) row[col / 32] |= 0x80000000u >> (col % 32);
        }
    }
    return row;
}

const std::array<PackedRow, kParityBits>& generator() {
    static const std::array<PackedRow, kParityBits> rows = [] {
        std::array<PackedRow, kParityBits> r{};
        for (size_t i = 0; i < kParityBits; ++i) r[i] = parse_generator_row(kGeneratorHex[i]);
        return r;
    }();
    return rows;
}

} // namespace

std::vector<uint8_t> encode(std::span<const uint8_t> block) {
    require_length("ldpc encoder input", block.size(), kBlockBits);

    PackedRow info{};
    for (size_t i = 0; i < kBlockBits; ++i)
        if (block[i] & 1u) info[i / 32] |= 0x80000000u >> (i % 32);

    std::vector<uint8_t> codeword(kCodewordBits);
    for (size_t i = 0; i < kBlockBits; ++i) codeword[i] = block[i] & 1u;

    const auto& G = generator();
    for (size_t r = 0; r < kParityBits; ++r) {
        unsigned int p = 0;
        for (size_t w = 0; w < kWords; ++w) p ^= liquid_bdotprod(G[r][w], info[w]);
        codeword[kBlockBits + r] = static_cast<uint8_t>(p & 1u);
    }
    return codeword;
}

size_t parity_failures(std::span<const uint8_t> codeword) {
    return FactorGraph::instance().unsatisfied(codeword);
}

} // namespace ft8::ldpc
