#pragma once
#include <cstdint>
#include <cstddef>
#include <span>
#include <vector>
#include "ft8/constants.hpp"

namespace ft8::utils {

// FT8 CRC-14. The polynomial is stored without its implicit x^14 term; the
// register starts at zero, runs MSB-first and has no final XOR.
struct Crc14 {
    uint16_t poly = kCrcPolynomial;

    // Remainder of the first `nbits` bits of an MSB-first packed buffer,
    // multiplied by x^14. Bits past `nbits` in the last byte must be zero.
    uint16_t compute_bytes(const uint8_t* data, size_t nbits) const;

    // CRC of a 77-bit message: the message is padded with 19 zero bits to a
    // 96-bit big-endian buffer and divided by the polynomial.
    uint16_t compute(std::span<const uint8_t> message) const;

    // Split a 91-bit block into message and trailer and compare.
    bool verify(std::span<const uint8_t> block) const;

    // message (77) ++ crc (14) -> 91-bit block.
    std::vector<uint8_t> append(std::span<const uint8_t> message) const;
};

} // namespace ft8::utils
