#include "ft8/constants.hpp"
#include "ft8/tx/frame_tx.hpp"
#include "ft8/utils/bit_packing.hpp"
#include <cstdio>
#include <exception>
#include <string>
#include <vector>

using namespace ft8;

static void usage(const char* a0) {
    std::fprintf(stderr,
        "Usage: %s --msg <hex77|bits77> [--codeword] [--json]\n"
        "  --msg       77-bit payload as hex (0x prefix optional) or a 77-char 0/1 string\n"
        "  --codeword  also print the 174-bit codeword as hex\n",
        a0);
}

int main(int argc, char** argv) {
    std::string msg_text; bool print_codeword = false; bool json = false;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--msg" && i+1 < argc) msg_text = argv[++i];
        else if (a == "--codeword") print_codeword = true;
        else if (a == "--json") json = true;
        else { usage(argv[0]); return 2; }
    }
    if (msg_text.empty()) { usage(argv[0]); return 2; }

    auto message = utils::parse_bits(msg_text, kMessageBits);
    if (message.size() != kMessageBits) {
        std::fprintf(stderr, "Cannot parse a 77-bit message from '%s'\n", msg_text.c_str());
        return 3;
    }

    std::vector<uint8_t> tones, codeword;
    try {
        codeword = tx::encode_codeword(message);
        tones = tx::encode_message(message);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Encode failed: %s\n", e.what());
        return 4;
    }

    if (json) {
        std::printf("{\"message\":\"%s\",", utils::bits_to_hex(message).c_str());
        if (print_codeword) std::printf("\"codeword\":\"%s\",", utils::bits_to_hex(codeword).c_str());
        std::printf("\"tones\":[");
        for (size_t i = 0; i < tones.size(); ++i)
            std::printf("%u%s", (unsigned)tones[i], (i+1 < tones.size()) ? "," : "");
        std::printf("]}\n");
        return 0;
    }

    if (print_codeword) std::printf("codeword %s\n", utils::bits_to_hex(codeword).c_str());
    for (uint8_t t : tones) std::printf("%u", (unsigned)t);
    std::printf("\n");
    return 0;
}
