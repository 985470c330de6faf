#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace ft8 {

// Raised whenever a bit, LLR or tone sequence does not have the fixed size an
// operation requires. Inputs are never truncated or padded.
class InvalidLength : public std::invalid_argument {
public:
    InvalidLength(const std::string& what, size_t expected, size_t got)
        : std::invalid_argument(what + ": expected " + std::to_string(expected) +
                                " elements, got " + std::to_string(got)),
          expected_(expected), got_(got) {}

    size_t expected() const noexcept { return expected_; }
    size_t got() const noexcept { return got_; }

private:
    size_t expected_;
    size_t got_;
};

inline void require_length(const char* what, size_t got, size_t expected) {
    if (got != expected) throw InvalidLength(what, expected, got);
}

} // namespace ft8
