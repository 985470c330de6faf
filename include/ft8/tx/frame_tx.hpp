#pragma once
#include <cstdint>
#include <span>
#include <vector>

namespace ft8::tx {

// message (77) -> message ++ CRC-14 (91).
std::vector<uint8_t> encode_block(std::span<const uint8_t> message);

// message (77) -> systematic LDPC codeword (174).
std::vector<uint8_t> encode_codeword(std::span<const uint8_t> message);

// Insert the three Costas arrays around 58 data tones -> 79 channel tones.
std::vector<uint8_t> assemble_frame(std::span<const uint8_t> data_tones);

// Full transmit chain: CRC-14, LDPC, Gray map and Costas insertion.
// Returns 79 tone indices in [0,7] for the waveform synthesiser.
std::vector<uint8_t> encode_message(std::span<const uint8_t> message);

} // namespace ft8::tx
