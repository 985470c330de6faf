#pragma once
#include <span>
#include <stop_token>
#include "ft8/ldpc/decode_result.hpp"
#include "ft8/utils/crc.hpp"

namespace ft8::ldpc {

// Early abort for attempts that are not going anywhere. A counter is reset
// whenever the number of unsatisfied checks strictly drops and incremented
// otherwise; the attempt is abandoned once
//   counter >= window && iteration >= min_iterations && unsatisfied > min_unsatisfied.
struct StagnationPolicy {
    bool enabled        = true;
    int  window         = 5;
    int  min_iterations = 10;
    int  min_unsatisfied = 15;
};

struct BpConfig {
    int   max_iterations = 200;
    float llr_clip       = 40.0f;  // channel LLRs are clamped to +-llr_clip
    StagnationPolicy stagnation;
};

/**
 * Sum-product decoder for the (174,91) code.
 *
 * LLR sign convention: positive means bit 1. Each iteration runs the check
 * node update, takes a hard decision, tests parity and (when all 83 checks
 * hold) the CRC-14 of bits [0,91), applies the stagnation policy and finally
 * computes the extrinsic bit-to-check messages for the next round. A valid
 * LDPC codeword whose CRC fails does not end the attempt.
 *
 * The decoder holds only configuration; all message state lives in the
 * decode() call, so one instance can serve many threads concurrently.
 */
class BpDecoder {
public:
    explicit BpDecoder(BpConfig cfg = {});

    const BpConfig& config() const { return cfg_; }

    // `llr` must hold exactly 174 values (InvalidLength otherwise). The stop
    // token is polled between iterations only.
    DecodeResult decode(std::span<const float> llr, std::stop_token stop = {}) const;

private:
    BpConfig cfg_;
    utils::Crc14 crc_;
};

} // namespace ft8::ldpc
