// llb_merge.cpp
// Union of saved LogLog-Beta sketches (files written by llb_count --save).
// Prints every input's estimate and the estimate of the merged sketch.
// All inputs must share one precision and must have been built with the same
// hash function and seed; only the precision can be checked here.
//
// CLI:   llb_merge IN1 IN2 ... [--out merged.llb]

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "sketch/llb_io.hpp"
#include "sketch/loglogbeta.hpp"
#include "sketch/sharded.hpp"

int main(int argc, char** argv) {
    try {
        std::vector<std::string> inputs;
        std::string out;

        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--out") {
                if (i + 1 >= argc) throw std::runtime_error("missing value for " + a);
                out = argv[++i];
            }
            else if (a == "--help" || a == "-h") {
                std::cout << "Usage: llb_merge IN1 IN2 ... [--out merged.llb]\n";
                return 0;
            }
            else if (a.rfind("--", 0) == 0) {
                throw std::runtime_error("unknown option: " + a);
            }
            else {
                inputs.push_back(a);
            }
        }
        if (inputs.empty()) throw std::runtime_error("no input sketches");

        std::vector<sketch::LogLogBeta<>> parts;
        parts.reserve(inputs.size());
        std::cout << std::fixed << std::setprecision(0);
        for (const auto& path : inputs) {
            parts.push_back(sketch::load(path));
            std::cout << path << "  p=" << parts.back().precision()
                << "  estimate " << parts.back().estimate() << "\n";
        }

        const auto u = sketch::merge_all(std::span<const sketch::LogLogBeta<>>(parts));
        std::cout << "union  estimate " << u.estimate() << "\n";

        if (!out.empty()) {
            sketch::save(out, u);
            std::cerr << "wrote " << out << "\n";
        }
        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 1;
    }
}
