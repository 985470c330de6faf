#pragma once
#include <complex>
#include <cstdint>
#include <span>
#include <stop_token>
#include <vector>
#include "ft8/ldpc/bp_decoder.hpp"

namespace ft8::rx {

enum class FrameStatus : uint8_t {
    Decoded,
    SyncRejected,  // too few Costas tones detected
    DecodeFailed,  // every demap depth failed in the LDPC decoder
};

struct FrameDecoderConfig {
    int min_costas_matches = 7;   // of 21
    int max_demap_depth    = 3;   // try depths 1..max_demap_depth
    ldpc::BpConfig bp;
};

struct FrameDecodeResult {
    FrameStatus status{FrameStatus::DecodeFailed};
    std::vector<uint8_t> message;  ///< 77 bits when decoded
    ldpc::DecodeResult ldpc;       ///< last LDPC attempt
    int depth{0};                  ///< demap depth of the last attempt
    int costas_matches{0};

    bool ok() const { return status == FrameStatus::Decoded; }
};

// Receive chain from tone observations (79 x 8, row-major) to message bits:
// Costas sanity check, then soft demap and BP decode at increasing demap
// depth until one succeeds.
class FrameDecoder {
public:
    explicit FrameDecoder(FrameDecoderConfig cfg = {});

    FrameDecodeResult decode(std::span<const std::complex<float>> obs,
                             std::stop_token stop = {}) const;

private:
    FrameDecoderConfig cfg_;
    ldpc::BpDecoder bp_;
};

} // namespace ft8::rx
