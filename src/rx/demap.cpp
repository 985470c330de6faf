#include "ft8/rx/demap.hpp"
#include "ft8/constants.hpp"
#include "ft8/errors.hpp"
#include "ft8/utils/gray.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace ft8::rx {

static constexpr int   kMaxDepth  = 3;
static constexpr float kLlrScale  = 2.83f;

std::vector<float> demap(std::span<const std::complex<float>> obs, int depth) {
    require_length("tone observations", obs.size(), kFrameSymbols * kToneCount);
    if (depth < 1 || depth > kMaxDepth)
        throw std::invalid_argument("demap depth must be 1..3");

    std::vector<float> llr(kCodewordBits, 0.0f);
    std::vector<float> mag(size_t{1} << (kMaxDepth * kToneBits));

    for (size_t first = 0; first < kDataSymbols; first += static_cast<size_t>(depth)) {
        const size_t nsym  = std::min<size_t>(static_cast<size_t>(depth), kDataSymbols - first);
        const size_t nbits = nsym * kToneBits;
        const size_t nperm = size_t{1} << nbits;

        // First symbol of the group sits in the most significant bits of p.
        for (size_t p = 0; p < nperm; ++p) {
            std::complex<float> s{0.0f, 0.0f};
            for (size_t j = 0; j < nsym; ++j) {
                size_t v = (p >> ((nsym - 1 - j) * kToneBits)) & (kToneCount - 1);
                size_t row = kDataSymbolOffsets[first + j];
                s += obs[row * kToneCount + utils::kGrayMap[v]];
            }
            mag[p] = std::abs(s);
        }

        for (size_t b = 0; b < nbits; ++b) {
            const size_t mask = size_t{1} << (nbits - 1 - b);
            float best1 = -std::numeric_limits<float>::infinity();
            float best0 = -std::numeric_limits<float>::infinity();
            for (size_t p = 0; p < nperm; ++p) {
                if (p & mask) best1 = std::max(best1, mag[p]);
                else          best0 = std::max(best0, mag[p]);
            }
            llr[first * kToneBits + b] = best1 - best0;
        }
    }

    double sum = 0.0, sum2 = 0.0;
    for (float v : llr) { sum += v; sum2 += double(v) * v; }
    const double mean = sum / kCodewordBits;
    const double var  = sum2 / kCodewordBits - mean * mean;
    if (var > 0.0 && std::isfinite(var)) {
        const float scale = kLlrScale / static_cast<float>(std::sqrt(var));
        for (auto& v : llr) v *= scale;
    }
    return llr;
}

std::vector<uint8_t> hard_tones(std::span<const std::complex<float>> obs) {
    require_length("tone observations", obs.size(), kFrameSymbols * kToneCount);
    std::vector<uint8_t> tones(kFrameSymbols);
    for (size_t s = 0; s < kFrameSymbols; ++s) {
        auto row = obs.subspan(s * kToneCount, kToneCount);
        size_t best = 0;
        for (size_t t = 1; t < kToneCount; ++t)
            if (std::norm(row[t]) > std::norm(row[best])) best = t;
        tones[s] = static_cast<uint8_t>(best);
    }
    return tones;
}

size_t count_costas_matches(std::span<const std::complex<float>> obs) {
    auto tones = hard_tones(obs);
    size_t good = 0;
    for (size_t off : kCostasOffsets)
        for (size_t k = 0; k < kCostas.size(); ++k)
            if (tones[off + k] == kCostas[k]) ++good;
    return good;
}

} // namespace ft8::rx
