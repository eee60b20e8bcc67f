// llb_count.cpp
// Distinct-word count of a text file (or stdin) with a LogLog-Beta sketch.
//
// Words are whitespace-separated tokens. The sketch is built on N threads
// (one private sketch per thread, merged at the end) and can be written out
// for llb_merge.
//
// CLI:
//   --file F        input text (default: stdin)
//   --error E       target relative error (default 0.01)
//   --precision P   register count 2^P, overrides --error
//   --hash H        rapid | sip (default rapid)
//   --seed S        hash seed (default 0 = the hasher's default)
//   --threads N     worker threads (default: hardware concurrency)
//   --save OUT      write the sketch registers to OUT
//   --exact         also count exactly with a hash set and print the error
//   --help/-h

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_set>
#include <vector>

#include "core/timer.hpp"
#include "core/words.hpp"
#include "hash/rapidhash64.hpp"
#include "hash/siphash.hpp"
#include "sketch/llb_io.hpp"
#include "sketch/loglogbeta.hpp"
#include "sketch/sharded.hpp"

int main(int argc, char** argv) {
    try {
        std::string infile, hash = "rapid", save;
        double error = 0.01;
        int precision = -1;
        std::uint64_t seed = 0;
        bool exact = false;
        unsigned threads = std::thread::hardware_concurrency();
        if (threads == 0) threads = 4;

        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            auto next = [&]() {
                if (i + 1 < argc) return std::string(argv[++i]);
                throw std::runtime_error("missing value for " + a);
                };
            if (a == "--file") infile = next();
            else if (a == "--error") error = std::stod(next());
            else if (a == "--precision") precision = std::stoi(next());
            else if (a == "--hash") hash = next();
            else if (a == "--seed") seed = std::stoull(next(), nullptr, 0);
            else if (a == "--threads") threads = static_cast<unsigned>(std::stoul(next()));
            else if (a == "--save") save = next();
            else if (a == "--exact") exact = true;
            else if (a == "--help" || a == "-h") {
                std::cout << "Usage: llb_count [--file words.txt] [--error 0.01 | --precision P] "
                    "[--hash rapid|sip] [--seed S] [--threads N] [--save out.llb] [--exact]\n";
                return 0;
            }
            else {
                throw std::runtime_error("unknown option: " + a);
            }
        }
        if (hash != "rapid" && hash != "sip") throw std::runtime_error("unknown hash: " + hash);

        std::unique_ptr<datasets::Words> words;
        Stopwatch sw;
        if (infile.empty()) words = std::make_unique<datasets::Words>(std::cin);
        else words = std::make_unique<datasets::Words>(infile);
        const double t_read = sw.lap();

        const std::vector<std::string_view> items = words->views();
        std::cerr << "read " << items.size() << " words (" << words->bytes() << " bytes) in "
            << std::fixed << std::setprecision(3) << t_read << " s\n";

        auto run = [&](auto hasher) {
            using H = decltype(hasher);
            const unsigned p = precision >= 0 ? static_cast<unsigned>(precision)
                : sketch::LogLogBeta<H>::precision_for(error);
            sw.lap();
            auto llb = sketch::build_sharded<H, std::string_view>(std::span<const std::string_view>(items),
                p, threads, hasher);
            const double t_build = sw.lap();
            const double est = llb.estimate();

            std::cout << std::fixed << std::setprecision(0) << "estimate  " << est << "\n"
                << "precision " << llb.precision() << "  (m=" << llb.size() << ", hash=" << hash << ")\n";
            std::cerr << "sketched in " << std::setprecision(3) << t_build << " s ("
                << std::setprecision(0) << throughput(items.size(), t_build) << " words/s, "
                << threads << " threads)\n";

            if (exact) {
                std::unordered_set<std::string_view> distinct(items.begin(), items.end());
                const double truth = static_cast<double>(distinct.size());
                std::cout << "exact     " << distinct.size() << "\n"
                    << "relerr    " << std::setprecision(5)
                    << (truth > 0.0 ? (est - truth) / truth : 0.0) << "\n";
            }
            if (!save.empty()) {
                sketch::save(save, llb);
                std::cerr << "wrote " << save << "\n";
            }
            };

        if (hash == "sip") run(hashfn::SipHash24(seed, ~seed));
        else run(seed ? hashfn::RapidHash64(seed) : hashfn::RapidHash64());
        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 1;
    }
}
