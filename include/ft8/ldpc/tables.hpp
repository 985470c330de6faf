#pragma once
#include <array>
#include <cstdint>
#include "ft8/constants.hpp"

namespace ft8::ldpc {

struct CheckRow {
    uint8_t degree;                                 ///< 6 or 7
    std::array<uint8_t, kMaxCheckDegree> bits;      ///< first `degree` entries valid
};

// Reference generator matrix of the (174,91) code, one hex row per parity bit.
extern const std::array<const char*, kParityBits> kGeneratorHex;

// Reference parity-check equations, one row per check node.
extern const std::array<CheckRow, kParityBits> kCheckRows;

} // namespace ft8::ldpc
