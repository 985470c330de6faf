// Helpers for moving between one-bit-per-byte vectors and packed bytes.
// FT8 orders bits MSB-first: bit 0 of a sequence is the top bit of byte 0.
#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace ft8::utils {

// Pack bits (each entry 0/1) into bytes, MSB-first within each byte.
// A trailing partial byte is zero-filled in its low bits.
inline std::vector<uint8_t> pack_bits_msb_first(std::span<const uint8_t> bits) {
    std::vector<uint8_t> out((bits.size() + 7) / 8, 0);
    for (size_t i = 0; i < bits.size(); ++i)
        if (bits[i] & 1u) out[i / 8] |= static_cast<uint8_t>(0x80u >> (i % 8));
    return out;
}

inline std::vector<uint8_t> unpack_bits_msb_first(std::span<const uint8_t> bytes, size_t bit_count) {
    std::vector<uint8_t> bits;
    bits.reserve(bit_count);
    for (size_t i = 0; i < bit_count && i / 8 < bytes.size(); ++i)
        bits.push_back((bytes[i / 8] >> (7 - i % 8)) & 1u);
    return bits;
}

// Parse a bit string ("0101...") or a hex string into `bit_count` bits.
// Hex input is right-aligned: the value's least significant bit becomes the
// last bit of the sequence. Returns an empty vector on malformed input.
std::vector<uint8_t> parse_bits(const std::string& text, size_t bit_count);

// Inverse of parse_bits for hex output (right-aligned, lowercase).
std::string bits_to_hex(std::span<const uint8_t> bits);

} // namespace ft8::utils
