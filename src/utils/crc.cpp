#include "ft8/utils/crc.hpp"
#include "ft8/errors.hpp"
#include "ft8/utils/bit_packing.hpp"
#include <algorithm>

namespace ft8::utils {

static constexpr uint16_t kTopBit  = 1u << (kCrcBits - 1);
static constexpr uint16_t kCrcMask = (1u << kCrcBits) - 1u;

uint16_t Crc14::compute_bytes(const uint8_t* data, size_t nbits) const {
    uint16_t rem = 0;
    size_t byte_idx = 0;
    for (size_t bit = 0; bit < nbits; ++bit) {
        if (bit % 8 == 0)
            rem ^= static_cast<uint16_t>(data[byte_idx++]) << (kCrcBits - 8);
        if (rem & kTopBit) rem = static_cast<uint16_t>((rem << 1) ^ poly);
        else               rem = static_cast<uint16_t>(rem << 1);
    }
    return rem & kCrcMask;
}

uint16_t Crc14::compute(std::span<const uint8_t> message) const {
    require_length("crc14 message", message.size(), kMessageBits);
    // 77 message bits + 19 zero bits, big-endian.
    std::vector<uint8_t> buf(kCrcPaddedBits / 8, 0);
    auto packed = pack_bits_msb_first(message);
    std::copy(packed.begin(), packed.end(), buf.begin());
    return compute_bytes(buf.data(), kCrcPaddedBits - kCrcBits);
}

bool Crc14::verify(std::span<const uint8_t> block) const {
    require_length("crc14 block", block.size(), kBlockBits);
    uint16_t got = 0;
    for (size_t i = kMessageBits; i < kBlockBits; ++i)
        got = static_cast<uint16_t>((got << 1) | (block[i] & 1u));
    return compute(block.first(kMessageBits)) == got;
}

std::vector<uint8_t> Crc14::append(std::span<const uint8_t> message) const {
    uint16_t crc = compute(message);
    std::vector<uint8_t> block(message.begin(), message.end());
    block.reserve(kBlockBits);
    for (int i = static_cast<int>(kCrcBits) - 1; i >= 0; --i)
        block.push_back((crc >> i) & 1u);
    return block;
}

} // namespace ft8::utils
