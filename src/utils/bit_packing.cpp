#include "ft8/utils/bit_packing.hpp"
#include <cctype>

namespace ft8::utils {

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

std::vector<uint8_t> parse_bits(const std::string& text, size_t bit_count) {
    std::string s = text;
    if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
        s = s.substr(2);
    } else if (s.size() == bit_count &&
               s.find_first_not_of("01") == std::string::npos) {
        std::vector<uint8_t> bits(bit_count);
        for (size_t i = 0; i < bit_count; ++i) bits[i] = static_cast<uint8_t>(s[i] - '0');
        return bits;
    }
    if (s.empty()) return {};

    // Walk the hex digits from the least significant end.
    std::vector<uint8_t> bits(bit_count, 0);
    size_t pos = bit_count;
    for (auto it = s.rbegin(); it != s.rend(); ++it) {
        int v = hex_value(*it);
        if (v < 0) return {};
        for (int b = 0; b < 4; ++b) {
            uint8_t bit = (v >> b) & 1;
            if (pos == 0) {
                if (bit) return {}; // value does not fit
                continue;
            }
            bits[--pos] = bit;
        }
    }
    return bits;
}

std::string bits_to_hex(std::span<const uint8_t> bits) {
    static constexpr char digits[] = "0123456789abcdef";
    size_t ndig = (bits.size() + 3) / 4;
    std::string out(ndig, '0');
    size_t pos = bits.size();
    for (size_t d = ndig; d-- > 0;) {
        int v = 0;
        for (int b = 0; b < 4 && pos > 0; ++b)
            v |= (bits[--pos] & 1) << b;
        out[d] = digits[v];
    }
    return out;
}

} // namespace ft8::utils
