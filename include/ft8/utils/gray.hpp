#pragma once
#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace ft8::utils {

// FT8 symbol-to-tone map. Tones one step apart carry 3-bit values that differ
// in a single bit, so the most likely demodulation error costs one bit.
inline constexpr std::array<uint8_t, 8> kGrayMap = {0, 1, 3, 2, 5, 6, 4, 7};

inline constexpr std::array<uint8_t, 8> make_gray_inverse() {
    std::array<uint8_t, 8> inv{};
    for (uint8_t s = 0; s < kGrayMap.size(); ++s) inv[kGrayMap[s]] = s;
    return inv;
}

inline constexpr std::array<uint8_t, 8> kGrayInverse = make_gray_inverse();

// Symbol value (0..7) -> tone index. Throws std::out_of_range above 7.
uint8_t encode_symbol(uint8_t symbol);

// Tone index (0..7) -> symbol value. Throws std::out_of_range above 7.
uint8_t decode_tone(uint8_t tone);

// Group bits into MSB-first triples and map each through kGrayMap.
// Throws InvalidLength when the bit count is not a multiple of 3.
std::vector<uint8_t> map_codeword_to_symbols(std::span<const uint8_t> bits);

// Hard inverse: tones back to bits, three per tone, MSB first.
std::vector<uint8_t> map_symbols_to_codeword(std::span<const uint8_t> tones);

} // namespace ft8::utils
