#pragma once
#include <complex>
#include <cstddef>
#include <span>
#include <vector>

namespace ft8::rx {

// Tone observations are row-major: 79 symbols x 8 tones, one complex DFT bin
// per tone, as produced by the demodulation collaborator.

// Soft-demap the 58 data symbols into 174 LLRs (positive means bit 1).
//
// `depth` consecutive symbols (1..3) are demapped jointly: for every bit
// permutation of the group the observations of the corresponding tones are
// summed coherently, and a bit's LLR is the largest |sum| with the bit set
// minus the largest |sum| with it clear. The last group is shortened when 58
// is not a multiple of depth. The result is scaled to unit standard deviation
// and multiplied by 2.83.
//
// Throws InvalidLength for a wrong observation count and
// std::invalid_argument for depth outside 1..3.
std::vector<float> demap(std::span<const std::complex<float>> obs, int depth = 1);

// Hard-detected tone per symbol (strongest bin).
std::vector<uint8_t> hard_tones(std::span<const std::complex<float>> obs);

// How many of the 21 Costas symbols were hard-detected on the expected tone.
size_t count_costas_matches(std::span<const std::complex<float>> obs);

} // namespace ft8::rx
