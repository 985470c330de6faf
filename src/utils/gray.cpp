#include "ft8/utils/gray.hpp"
#include "ft8/constants.hpp"
#include "ft8/errors.hpp"
#include <stdexcept>

namespace ft8::utils {

uint8_t encode_symbol(uint8_t symbol) {
    if (symbol >= kGrayMap.size()) throw std::out_of_range("symbol value must be 0..7");
    return kGrayMap[symbol];
}

uint8_t decode_tone(uint8_t tone) {
    if (tone >= kGrayInverse.size()) throw std::out_of_range("tone index must be 0..7");
    return kGrayInverse[tone];
}

std::vector<uint8_t> map_codeword_to_symbols(std::span<const uint8_t> bits) {
    if (bits.size() % kToneBits != 0)
        throw InvalidLength("gray map input (multiple of 3)",
                            bits.size() - bits.size() % kToneBits + kToneBits, bits.size());
    std::vector<uint8_t> tones;
    tones.reserve(bits.size() / kToneBits);
    for (size_t i = 0; i < bits.size(); i += kToneBits) {
        uint8_t v = static_cast<uint8_t>(((bits[i] & 1u) << 2) |
                                         ((bits[i + 1] & 1u) << 1) |
                                          (bits[i + 2] & 1u));
        tones.push_back(kGrayMap[v]);
    }
    return tones;
}

std::vector<uint8_t> map_symbols_to_codeword(std::span<const uint8_t> tones) {
    std::vector<uint8_t> bits;
    bits.reserve(tones.size() * kToneBits);
    for (uint8_t t : tones) {
        uint8_t v = decode_tone(t);
        bits.push_back((v >> 2) & 1u);
        bits.push_back((v >> 1) & 1u);
        bits.push_back(v & 1u);
    }
    return bits;
}

} // namespace ft8::utils
