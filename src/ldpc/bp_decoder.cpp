#include "ft8/ldpc/bp_decoder.hpp"
#include "ft8/constants.hpp"
#include "ft8/debug.hpp"
#include "ft8/errors.hpp"
#include "ft8/ldpc/factor_graph.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>
#include <utility>
#include <vector>

namespace ft8::ldpc {

namespace {

// |product| is kept below 1 so atanh stays finite; 2*atanh(1 - 1e-6) ~ 14.5.
constexpr float kMaxProduct = 1.0f - 1e-6f;

// Per-attempt working set. Bit-to-check messages are addressed by
// (check, slot in check), check-to-bit messages by (bit, slot in bit).
struct DecoderState {
    std::array<std::array<float, kMaxCheckDegree>, kParityBits> to_check{};
    std::array<std::array<float, kBitDegree>, kCodewordBits> to_bit{};
    std::array<float, kCodewordBits> channel{};
    std::vector<uint8_t> hard = std::vector<uint8_t>(kCodewordBits, 0);
    int iterations{0};
    int unsatisfied{static_cast<int>(kParityBits)};
};

void check_node_update(const FactorGraph& g, DecoderState& st) {
    std::array<float, kMaxCheckDegree> t{};
    for (size_t c = 0; c < kParityBits; ++c) {
        const size_t deg = g.check_degree(c);
        for (size_t k = 0; k < deg; ++k) t[k] = std::tanh(-0.5f * st.to_check[c][k]);
        auto bits = g.check_bits(c);
        for (size_t k = 0; k < deg; ++k) {
            float p = 1.0f;
            for (size_t j = 0; j < deg; ++j)
                if (j != k) p *= t[j];
            p = std::clamp(p, -kMaxProduct, kMaxProduct);
            st.to_bit[bits[k]][g.slot_in_bit(c, k)] = -2.0f * std::atanh(p);
        }
    }
}

void hard_decision(DecoderState& st) {
    for (size_t n = 0; n < kCodewordBits; ++n) {
        float l = st.channel[n] + st.to_bit[n][0] + st.to_bit[n][1] + st.to_bit[n][2];
        st.hard[n] = (l > 0.0f) ? 1 : 0;
    }
}

void bit_node_update(const FactorGraph& g, DecoderState& st) {
    for (size_t n = 0; n < kCodewordBits; ++n) {
        auto checks = g.bit_checks(n);
        for (size_t s = 0; s < kBitDegree; ++s) {
            float v = st.channel[n];
            for (size_t s2 = 0; s2 < kBitDegree; ++s2)
                if (s2 != s) v += st.to_bit[n][s2];
            st.to_check[checks[s]][g.slot_in_check(n, s)] = v;
        }
    }
}

DecodeResult finish(DecoderState& st, DecodeStatus status) {
    DecodeResult r;
    r.status = status;
    r.iterations = st.iterations;
    r.unsatisfied = st.unsatisfied;
    for (size_t n = 0; n < kCodewordBits; ++n)
        if ((st.hard[n] != 0) != (st.channel[n] > 0.0f)) ++r.hard_errors;
    r.codeword = std::move(st.hard);
    return r;
}

} // namespace

BpDecoder::BpDecoder(BpConfig cfg) : cfg_(cfg) {
    if (cfg_.max_iterations < 1)
        throw std::invalid_argument("bp decoder: max_iterations must be >= 1");
    if (!(cfg_.llr_clip > 0.0f))
        throw std::invalid_argument("bp decoder: llr_clip must be positive");
}

DecodeResult BpDecoder::decode(std::span<const float> llr, std::stop_token stop) const {
    require_length("bp decoder llr", llr.size(), kCodewordBits);
    const FactorGraph& g = FactorGraph::instance();

    DecoderState st;
    for (size_t n = 0; n < kCodewordBits; ++n) {
        float v = llr[n];
        if (!std::isfinite(v)) v = 0.0f; // erasure
        st.channel[n] = std::clamp(v, -cfg_.llr_clip, cfg_.llr_clip);
        st.hard[n] = st.channel[n] > 0.0f ? 1 : 0;
    }
    st.unsatisfied = static_cast<int>(g.unsatisfied(st.hard));

    // No check corrections yet: every bit sends its channel LLR.
    for (size_t c = 0; c < kParityBits; ++c) {
        auto bits = g.check_bits(c);
        for (size_t k = 0; k < bits.size(); ++k) st.to_check[c][k] = st.channel[bits[k]];
    }

    const StagnationPolicy& sp = cfg_.stagnation;
    int stall = 0;
    int last = 0;

    for (int iter = 1; iter <= cfg_.max_iterations; ++iter) {
        if (stop.stop_requested()) {
            debug::set_fail(debug::kFailCancelled);
            return finish(st, DecodeStatus::Cancelled);
        }
        st.iterations = iter;

        check_node_update(g, st);
        hard_decision(st);

        const int ncheck = static_cast<int>(g.unsatisfied(st.hard));
        st.unsatisfied = ncheck;
        debug::trace("[bp] iter=%d unsatisfied=%d\n", iter, ncheck);

        if (ncheck == 0) {
            if (crc_.verify(std::span<const uint8_t>(st.hard).first(kBlockBits))) {
                debug::clear_fail();
                return finish(st, DecodeStatus::Success);
            }
            debug::trace("[bp] iter=%d parity ok, crc mismatch\n", iter);
        }

        if (iter > 1) {
            stall = (ncheck < last) ? 0 : stall + 1;
            if (sp.enabled && stall >= sp.window && iter >= sp.min_iterations &&
                ncheck > sp.min_unsatisfied) {
                debug::set_fail(debug::kFailNonConvergent);
                return finish(st, DecodeStatus::NonConvergent);
            }
        }
        last = ncheck;

        bit_node_update(g, st);
    }

    debug::set_fail(debug::kFailMaxIterations);
    return finish(st, DecodeStatus::MaxIterationsExceeded);
}

} // namespace ft8::ldpc
