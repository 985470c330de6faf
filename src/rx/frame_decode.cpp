#include "ft8/rx/frame_decode.hpp"
#include "ft8/constants.hpp"
#include "ft8/debug.hpp"
#include "ft8/rx/demap.hpp"
#include <stdexcept>

namespace ft8::rx {

FrameDecoder::FrameDecoder(FrameDecoderConfig cfg) : cfg_(cfg), bp_(cfg.bp) {
    if (cfg_.max_demap_depth < 1 || cfg_.max_demap_depth > 3)
        throw std::invalid_argument("frame decoder: max_demap_depth must be 1..3");
}

FrameDecodeResult FrameDecoder::decode(std::span<const std::complex<float>> obs,
                                       std::stop_token stop) const {
    FrameDecodeResult res;
    res.costas_matches = static_cast<int>(count_costas_matches(obs));
    if (res.costas_matches < cfg_.min_costas_matches) {
        debug::set_fail(debug::kFailSync);
        debug::trace("[frame] costas matches %d < %d\n", res.costas_matches, cfg_.min_costas_matches);
        res.status = FrameStatus::SyncRejected;
        return res;
    }

    for (int depth = 1; depth <= cfg_.max_demap_depth; ++depth) {
        auto llr = demap(obs, depth);
        res.depth = depth;
        res.ldpc = bp_.decode(llr, stop);
        debug::trace("[frame] depth=%d status=%s iterations=%d\n", depth,
                     ldpc::to_string(res.ldpc.status), res.ldpc.iterations);
        if (res.ldpc.ok()) {
            auto msg = res.ldpc.message();
            res.message.assign(msg.begin(), msg.end());
            res.status = FrameStatus::Decoded;
            return res;
        }
        if (res.ldpc.status == ldpc::DecodeStatus::Cancelled) break;
    }
    res.status = FrameStatus::DecodeFailed;
    return res;
}

} // namespace ft8::rx
