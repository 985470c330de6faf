#include "ft8/constants.hpp"
#include "ft8/debug.hpp"
#include "ft8/ldpc/bp_decoder.hpp"
#include "ft8/utils/bit_packing.hpp"
#include <cstdio>
#include <exception>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace ft8;

static void usage(const char* a0) {
    std::fprintf(stderr,
        "Usage: %s --in <llr_file|-> [--max-iter N] [--no-stagnation] [--stall-window N] [--json]\n"
        "  LLR file: 174 whitespace-separated floats, positive means bit 1\n",
        a0);
}

static bool read_llrs(const std::string& path, std::vector<float>& out) {
    std::istream* in = nullptr; std::ifstream f;
    if (path == "-") {
        in = &std::cin;
    } else {
        f.open(path);
        if (!f) return false; in = &f;
    }
    out.clear(); float v;
    while (*in >> v) out.push_back(v);
    return in->eof();
}

int main(int argc, char** argv) {
    std::string in_path; bool json = false;
    ldpc::BpConfig cfg;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--in" && i+1 < argc) in_path = argv[++i];
            else if (a == "--max-iter" && i+1 < argc) cfg.max_iterations = std::stoi(argv[++i]);
            else if (a == "--no-stagnation") cfg.stagnation.enabled = false;
            else if (a == "--stall-window" && i+1 < argc) cfg.stagnation.window = std::stoi(argv[++i]);
            else if (a == "--json") json = true;
            else { usage(argv[0]); return 2; }
        }
    } catch (const std::exception&) {
        usage(argv[0]); return 2;
    }
    if (in_path.empty()) { usage(argv[0]); return 2; }

    std::vector<float> llr;
    if (!read_llrs(in_path, llr)) { std::fprintf(stderr, "Failed to read LLRs from %s\n", in_path.c_str()); return 3; }
    if (llr.size() != kCodewordBits) {
        std::fprintf(stderr, "Expected %zu LLRs, read %zu\n", kCodewordBits, llr.size());
        return 3;
    }

    ldpc::DecodeResult res;
    try {
        ldpc::BpDecoder dec(cfg);
        res = dec.decode(llr);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Decode failed: %s\n", e.what());
        return 4;
    }

    if (json) {
        std::printf("{\"status\":\"%s\",\"iterations\":%d,\"unsatisfied\":%d,\"hard_errors\":%d",
                    ldpc::to_string(res.status), res.iterations, res.unsatisfied, res.hard_errors);
        if (res.ok()) std::printf(",\"message\":\"%s\"", utils::bits_to_hex(res.message()).c_str());
        std::printf("}\n");
    } else {
        std::printf("status=%s iterations=%d unsatisfied=%d hard_errors=%d\n",
                    ldpc::to_string(res.status), res.iterations, res.unsatisfied, res.hard_errors);
        if (res.ok()) std::printf("message %s\n", utils::bits_to_hex(res.message()).c_str());
        else std::fprintf(stderr, "fail_step=%d\n", debug::last_fail_step);
    }
    return res.ok() ? 0 : 1;
}
