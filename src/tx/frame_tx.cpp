#include "ft8/tx/frame_tx.hpp"
#include "ft8/constants.hpp"
#include "ft8/errors.hpp"
#include "ft8/ldpc/encoder.hpp"
#include "ft8/utils/crc.hpp"
#include "ft8/utils/gray.hpp"
#include <algorithm>

namespace ft8::tx {

std::vector<uint8_t> encode_block(std::span<const uint8_t> message) {
    static const utils::Crc14 crc14;
    return crc14.append(message);
}

std::vector<uint8_t> encode_codeword(std::span<const uint8_t> message) {
    auto block = encode_block(message);
    return ldpc::encode(block);
}

std::vector<uint8_t> assemble_frame(std::span<const uint8_t> data_tones) {
    require_length("frame data tones", data_tones.size(), kDataSymbols);
    std::vector<uint8_t> frame(kFrameSymbols, 0);
    for (size_t off : kCostasOffsets)
        std::copy(kCostas.begin(), kCostas.end(), frame.begin() + static_cast<ptrdiff_t>(off));
    for (size_t i = 0; i < kDataSymbols; ++i) frame[kDataSymbolOffsets[i]] = data_tones[i];
    return frame;
}

std::vector<uint8_t> encode_message(std::span<const uint8_t> message) {
    auto codeword = encode_codeword(message);
    auto tones = utils::map_codeword_to_symbols(codeword);
    return assemble_frame(tones);
}

} // namespace ft8::tx
