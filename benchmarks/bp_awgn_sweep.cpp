#include "ft8/constants.hpp"
#include "ft8/ldpc/bp_decoder.hpp"
#include "ft8/tx/frame_tx.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <exception>
#include <fstream>
#include <random>
#include <string>
#include <vector>

using namespace ft8;

struct SweepConfig {
    float snr_min = -2.f;   // Eb/N0 in dB
    float snr_max = 4.f;
    float snr_step = 0.5f;
    int   frames = 200;
    uint32_t seed = 123;
    int   max_iter = 200;
    bool  stagnation = true;
    std::string csv;
};

static void usage(const char* a0) {
    std::fprintf(stderr,
        "Usage: %s [frames] [--snr-min dB] [--snr-max dB] [--snr-step dB] [--seed N]\n"
        "          [--max-iter N] [--no-stagnation] [--csv file]\n", a0);
}

int main(int argc, char** argv) {
    SweepConfig cfg;
    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--snr-min" && i+1 < argc) cfg.snr_min = std::stof(argv[++i]);
            else if (a == "--snr-max" && i+1 < argc) cfg.snr_max = std::stof(argv[++i]);
            else if (a == "--snr-step" && i+1 < argc) cfg.snr_step = std::stof(argv[++i]);
            else if (a == "--seed" && i+1 < argc) cfg.seed = static_cast<uint32_t>(std::stoul(argv[++i]));
            else if (a == "--max-iter" && i+1 < argc) cfg.max_iter = std::stoi(argv[++i]);
            else if (a == "--no-stagnation") cfg.stagnation = false;
            else if (a == "--csv" && i+1 < argc) cfg.csv = argv[++i];
            else if (!a.empty() && a[0] != '-') cfg.frames = std::stoi(a);
            else { usage(argv[0]); return 2; }
        }
    } catch (const std::exception&) {
        usage(argv[0]); return 2;
    }
    if (cfg.frames < 1 || cfg.snr_step <= 0.f) { usage(argv[0]); return 2; }

    std::mt19937 rng(cfg.seed);
    std::bernoulli_distribution coin(0.5);

    ldpc::BpConfig bp;
    bp.max_iterations = cfg.max_iter;
    bp.stagnation.enabled = cfg.stagnation;
    const ldpc::BpDecoder dec(bp);

    std::ofstream csv;
    if (!cfg.csv.empty()) {
        csv.open(cfg.csv);
        if (!csv) { std::fprintf(stderr, "Cannot open %s\n", cfg.csv.c_str()); return 3; }
        csv << "ebn0_db,frames,success,non_convergent,max_iterations,avg_iterations,us_per_frame\n";
    }

    const float rate = float(kBlockBits) / float(kCodewordBits);
    std::printf("ebn0_db,frames,success,non_convergent,max_iterations,avg_iterations,us_per_frame\n");

    for (float snr = cfg.snr_min; snr <= cfg.snr_max + 1e-3f; snr += cfg.snr_step) {
        // BPSK, unit symbol energy: sigma^2 = 1 / (2 R Eb/N0).
        const float ebn0 = std::pow(10.f, snr / 10.f);
        const float sigma = std::sqrt(1.f / (2.f * rate * ebn0));
        std::normal_distribution<float> noise(0.f, sigma);
        int ok = 0, nonconv = 0, maxit = 0; long iters = 0; double us = 0.0;

        std::vector<uint8_t> message(kMessageBits);
        std::vector<float> llr(kCodewordBits);
        for (int f = 0; f < cfg.frames; ++f) {
            for (auto& b : message) b = coin(rng) ? 1 : 0;
            auto cw = tx::encode_codeword(message);
            for (size_t n = 0; n < kCodewordBits; ++n) {
                float x = cw[n] ? 1.f : -1.f;
                float y = x + noise(rng);
                llr[n] = 2.f * y / (sigma * sigma);
            }

            auto t0 = std::chrono::steady_clock::now();
            auto res = dec.decode(llr);
            auto t1 = std::chrono::steady_clock::now();
            us += std::chrono::duration<double, std::micro>(t1 - t0).count();

            iters += res.iterations;
            switch (res.status) {
                case ldpc::DecodeStatus::Success:
                    if (std::equal(cw.begin(), cw.end(), res.codeword.begin())) ++ok;
                    break;
                case ldpc::DecodeStatus::NonConvergent:         ++nonconv; break;
                case ldpc::DecodeStatus::MaxIterationsExceeded: ++maxit;   break;
                case ldpc::DecodeStatus::Cancelled:             break;
            }
        }

        char line[160];
        std::snprintf(line, sizeof(line), "%.2f,%d,%d,%d,%d,%.2f,%.1f\n", snr, cfg.frames, ok, nonconv,
                      maxit, double(iters) / cfg.frames, us / cfg.frames);
        std::fputs(line, stdout);
        if (csv.is_open()) csv << line;
    }
    return 0;
}
