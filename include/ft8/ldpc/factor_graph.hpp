#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include "ft8/constants.hpp"
#include "ft8/ldpc/tables.hpp"

namespace ft8::ldpc {

/**
 * Bipartite graph of the (174,91) code: 174 bit nodes of degree 3 and 83
 * check nodes of degree 6 or 7, 522 edges in total.
 *
 * Adjacency is stored as flat index arrays. Every edge is reachable from both
 * ends as (node, local slot), and the slot of the opposite end is precomputed,
 * so per-edge message buffers can be addressed without searching.
 *
 * The process-wide instance is built once from kCheckRows and never mutated.
 */
class FactorGraph {
public:
    // Build from check-node rows; bit-node lists are derived by inversion.
    // Throws std::logic_error when the rows violate the code's structure.
    explicit FactorGraph(std::span<const CheckRow> rows);

    static const FactorGraph& instance();

    size_t check_degree(size_t check) const { return check_degree_[check]; }

    // Bit indices constrained by `check` (check_degree() entries).
    std::span<const uint16_t> check_bits(size_t check) const {
        return {check_bits_[check].data(), check_degree_[check]};
    }

    // The three checks bit `bit` participates in.
    std::span<const uint16_t, kBitDegree> bit_checks(size_t bit) const {
        return std::span<const uint16_t, kBitDegree>(bit_checks_[bit]);
    }

    // Position of `bit` inside the list of its `slot`-th check.
    uint8_t slot_in_check(size_t bit, size_t slot) const { return slot_in_check_[bit][slot]; }

    // Position of `check` inside the list of its `slot`-th bit.
    uint8_t slot_in_bit(size_t check, size_t slot) const { return slot_in_bit_[check][slot]; }

    size_t edge_count() const { return edges_; }

    // Number of parity equations the hard-decision codeword violates.
    size_t unsatisfied(std::span<const uint8_t> codeword) const;

private:
    std::array<std::array<uint16_t, kMaxCheckDegree>, kParityBits> check_bits_{};
    std::array<uint8_t, kParityBits> check_degree_{};
    std::array<std::array<uint8_t, kMaxCheckDegree>, kParityBits> slot_in_bit_{};
    std::array<std::array<uint16_t, kBitDegree>, kCodewordBits> bit_checks_{};
    std::array<std::array<uint8_t, kBitDegree>, kCodewordBits> slot_in_check_{};
    size_t edges_{0};
};

} // namespace ft8::ldpc
