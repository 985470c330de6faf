#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace ft8::ldpc {

// Systematic (174,91) encoder: the 91 input bits are copied to positions
// [0,91) and the 83 parity bits (one GF(2) dot product per generator row)
// follow at [91,174). Throws InvalidLength on a wrong input size.
std::vector<uint8_t> encode(std::span<const uint8_t> block);

// Number of parity equations the codeword violates (0 for a valid codeword).
size_t parity_failures(std::span<const uint8_t> codeword);

inline bool is_codeword(std::span<const uint8_t> codeword) {
    return parity_failures(codeword) == 0;
}

} // namespace ft8::ldpc
