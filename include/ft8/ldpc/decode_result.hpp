#pragma once
#include <cstdint>
#include <span>
#include <vector>
#include "ft8/constants.hpp"

namespace ft8::ldpc {

// Outcome of one decode attempt. Any codeword decoder (belief propagation
// today, ordered statistics later) reports through this type so callers can
// swap decoders without changing how they consume results.
enum class DecodeStatus : uint8_t {
    Success,               // parity and CRC-14 both hold
    NonConvergent,         // stagnation policy gave up
    MaxIterationsExceeded, // iteration budget spent
    Cancelled,             // stop requested between iterations
};

inline const char* to_string(DecodeStatus s) {
    switch (s) {
        case DecodeStatus::Success:               return "success";
        case DecodeStatus::NonConvergent:         return "non-convergent";
        case DecodeStatus::MaxIterationsExceeded: return "max-iterations";
        case DecodeStatus::Cancelled:             return "cancelled";
    }
    return "?";
}

struct DecodeResult {
    DecodeStatus status{DecodeStatus::MaxIterationsExceeded};
    std::vector<uint8_t> codeword; ///< last hard decision (174 bits), valid on every status
    int iterations{0};             ///< iterations run
    int unsatisfied{0};            ///< parity failures of `codeword`
    int hard_errors{0};            ///< bits where `codeword` disagrees with the channel LLR sign

    bool ok() const { return status == DecodeStatus::Success; }

    // Bits [0,77) of the codeword, the payload handed to message unpacking.
    std::span<const uint8_t> message() const {
        return std::span<const uint8_t>(codeword).first(codeword.empty() ? 0 : kMessageBits);
    }
};

} // namespace ft8::ldpc
