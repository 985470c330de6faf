#pragma once
#include <array>
#include <cstddef>
#include <cstdint>

namespace ft8 {

// Block layout of the (174,91) code: 77 message bits, 14 CRC bits, 83 parity bits.
inline constexpr size_t kMessageBits  = 77;
inline constexpr size_t kCrcBits      = 14;
inline constexpr size_t kBlockBits    = kMessageBits + kCrcBits;   // 91
inline constexpr size_t kParityBits   = 83;
inline constexpr size_t kCodewordBits = kBlockBits + kParityBits;  // 174

// CRC-14 generator without its x^14 term, and the zero-padded buffer it runs over.
inline constexpr uint16_t kCrcPolynomial = 0x2757;
inline constexpr size_t   kCrcPaddedBits = 96;

// 8-FSK line coding: three codeword bits per tone.
inline constexpr size_t kToneBits    = 3;
inline constexpr size_t kToneCount   = 1u << kToneBits;              // 8
inline constexpr size_t kDataSymbols = kCodewordBits / kToneBits;    // 58

// Costas synchronisation arrays framing the two halves of the data symbols.
inline constexpr std::array<uint8_t, 7> kCostas = {3, 1, 4, 0, 6, 5, 2};
inline constexpr std::array<size_t, 3>  kCostasOffsets = {0, 36, 72};
inline constexpr size_t kCostasSymbols = kCostas.size() * kCostasOffsets.size(); // 21
inline constexpr size_t kFrameSymbols  = kDataSymbols + kCostasSymbols;          // 79

// Frame positions of the 58 data symbols: the gaps between the Costas arrays.
inline constexpr std::array<size_t, kDataSymbols> make_data_symbol_offsets() {
    std::array<size_t, kDataSymbols> off{};
    size_t k = 0;
    for (size_t pos = 0; pos < kFrameSymbols; ++pos) {
        bool costas = false;
        for (size_t c : kCostasOffsets)
            if (pos >= c && pos < c + kCostas.size()) costas = true;
        if (!costas) off[k++] = pos;
    }
    return off;
}

inline constexpr std::array<size_t, kDataSymbols> kDataSymbolOffsets = make_data_symbol_offsets();

// Factor graph degrees.
inline constexpr size_t kBitDegree      = 3;
inline constexpr size_t kMaxCheckDegree = 7;
inline constexpr size_t kEdgeCount      = kCodewordBits * kBitDegree;            // 522

} // namespace ft8
