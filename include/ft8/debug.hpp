// Lightweight debug hooks for internal decode steps.
#pragma once
#include <cstdio>
#include <cstdlib>

namespace ft8 { namespace debug {

// Failure codes recorded by the RX helpers.
enum FailStep : int {
    kFailNone          = 0,
    kFailSync          = 1, // too few Costas tones matched
    kFailNonConvergent = 2, // BP stagnation abort
    kFailMaxIterations = 3, // BP ran out of iterations
    kFailCancelled     = 4, // stop requested between iterations
};

inline thread_local int last_fail_step = kFailNone; // set by RX helpers on failure paths
inline void set_fail(int code) { last_fail_step = code; }
inline void clear_fail() { last_fail_step = kFailNone; }

// Per-iteration traces go to stderr when FT8_FEC_TRACE is set in the environment.
inline bool trace_enabled() {
    static const bool on = std::getenv("FT8_FEC_TRACE") != nullptr;
    return on;
}

template <typename... Args>
inline void trace(const char* fmt, Args... args) {
    if (trace_enabled()) std::fprintf(stderr, fmt, args...);
}

} } // namespace ft8::debug
