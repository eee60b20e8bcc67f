// llb_accuracy.cpp
// Multi-core LogLog-Beta accuracy over repeated trials, per hash function.
// CSV: function,rep,relerr   where relerr = (est - Dtrue) / Dtrue
//
// Hashers (fresh parameters each repetition, drawn from rng::get_u64()):
//   - SipHash24   : keyed SipHash-2-4
//   - RapidHash64 : seeded rapidhash
// For each hasher two rows are written per repetition:
//   <name>        one sketch over the whole key stream
//   <name>-union  two sketches over a disjoint A/B split, merged
//
// Dataset:
//   - datasets::Keys(ITEMS, 2, 0, seed): every key twice, shuffled, so the
//     true distinct count is ITEMS and duplicates are interleaved.
//   - datasets::KeysSplit(ITEMS, seed): the same keys split into disjoint halves.
//
// CLI:
//   --items N   distinct keys (default 100000)
//   --R R       repetitions (default 1000)
//   --error E   target error rate (default 0.02)
//   --out FILE  output CSV
//   --threads N thread count
//   --seed S    seed for rng::RandomPool (default LLB_DEFAULT_SEED)

#include <atomic>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "core/keys.hpp"
#include "core/randomgen.hpp"
#include "core/timer.hpp"
#include "hash/rapidhash64.hpp"
#include "hash/siphash.hpp"
#include "sketch/loglogbeta.hpp"

// Feed a whole stream into a sketch.
template <class Sketch>
static void feed(Sketch& s, Stream& st) {
    const void* p; std::size_t len;
    st.reset();
    while (st.next(p, len)) s.insert(p, len);
}

template <class Hasher>
static void run_hasher(const char* name, const Hasher& h, std::size_t rep, double error, double Dtrue,
    const datasets::Keys& keys, const datasets::KeysSplit& split, std::ostringstream& buf)
{
    sketch::LogLogBeta<Hasher> whole(error, h);
    auto st = keys.make_stream();
    feed(whole, st);
    buf << name << "," << rep << "," << (whole.estimate() - Dtrue) / Dtrue << "\n";

    sketch::LogLogBeta<Hasher> a(error, h), b(error, h);
    auto sa = split.make_streamA();
    auto sb = split.make_streamB();
    feed(a, sa);
    feed(b, sb);
    a.merge(b);
    buf << name << "-union," << rep << "," << (a.estimate() - Dtrue) / Dtrue << "\n";
}

int main(int argc, char** argv) {
    try {
        // Defaults
        std::size_t ITEMS = 100'000;
        std::size_t R = 1'000;
        double error = 0.02;
        std::string outfile = "llb_relerr.csv";
        std::uint64_t seed = LLB_DEFAULT_SEED;
        unsigned threads = std::thread::hardware_concurrency();
        if (threads == 0) threads = 4;

        // Parse CLI
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto next = [&]() -> std::string {
                if (i + 1 < argc) return std::string(argv[++i]);
                throw std::runtime_error("Missing value for " + arg);
                };
            if (arg == "--items") ITEMS = std::stoull(next());
            else if (arg == "--R") R = std::stoull(next());
            else if (arg == "--error") error = std::stod(next());
            else if (arg == "--out") outfile = next();
            else if (arg == "--threads") threads = static_cast<unsigned>(std::stoul(next()));
            else if (arg == "--seed") seed = std::stoull(next(), nullptr, 0);
            else if (arg == "--help" || arg == "-h") {
                std::cout << "Usage: llb_accuracy "
                    "[--items 100000] [--R 1000] [--error 0.02] "
                    "[--out file.csv] [--threads N] [--seed S]\n";
                return 0;
            }
            else {
                throw std::runtime_error("unknown option: " + arg);
            }
        }
        if (threads == 0) threads = 1;

        // Validates the error rate before any work is done.
        const unsigned p = sketch::LogLogBeta<>::precision_for(error);

        std::cout << "LogLog-Beta accuracy on synthetic keys\n"
            << "  items=" << ITEMS << "  error=" << error << " (p=" << p << ", expected stderr "
            << 1.04 / std::sqrt(double(1u << p)) << ")  R=" << R
            << "  threads=" << threads << "\n"
            << "Writing: " << outfile << "\n";

        std::ofstream out(outfile, std::ios::binary);
        if (!out) { std::cerr << "Cannot open output file: " << outfile << "\n"; return 1; }
        out.setf(std::ios::fixed);
        out << std::setprecision(8);
        out << "function,rep,relerr\n";

        // ---------- Build the datasets once ----------
        rng::reseed(seed);
        const datasets::Keys keys(ITEMS, 2, 0, rng::get_u64() | 1ull);
        const datasets::KeysSplit split(ITEMS, rng::get_u64());
        const double Dtrue = static_cast<double>(keys.distinct());

        // Pre-generate hash parameters per repetition
        struct RepParams { std::uint64_t sip_k0, sip_k1, rapid_seed; };
        std::vector<RepParams> params(R);
        for (std::size_t r = 0; r < R; ++r) {
            params[r].sip_k0 = rng::get_u64();
            params[r].sip_k1 = rng::get_u64();
            params[r].rapid_seed = rng::get_u64();
        }

        std::mutex file_mtx;   // protect final file writes
        std::mutex cout_mtx;   // protect progress printing
        std::atomic<std::size_t> done{ 0 };
        constexpr std::size_t PROG_STEP = 100;

        auto worker = [&](unsigned tid) {
            std::ostringstream buf;
            buf.setf(std::ios::fixed);
            buf << std::setprecision(8);
            for (std::size_t r = tid; r < R; r += threads) {
                run_hasher("SipHash24", hashfn::SipHash24(params[r].sip_k0, params[r].sip_k1),
                    r + 1, error, Dtrue, keys, split, buf);
                run_hasher("RapidHash64", hashfn::RapidHash64(params[r].rapid_seed),
                    r + 1, error, Dtrue, keys, split, buf);

                std::size_t n = done.fetch_add(1, std::memory_order_relaxed) + 1;
                if ((n % PROG_STEP) == 0 || n == R) {
                    std::lock_guard<std::mutex> io(cout_mtx);
                    std::cout << "  rep " << n << " / " << R
                        << "  (" << (100.0 * double(n) / double(R)) << "%)\r"
                        << std::flush;
                }
            }
            // Flush this thread's chunk
            { std::lock_guard<std::mutex> fl(file_mtx); out << buf.str(); }
            };

        Stopwatch sw;
        std::vector<std::thread> pool; pool.reserve(threads);
        for (unsigned t = 0; t < threads; ++t) pool.emplace_back(worker, t);
        for (auto& th : pool) th.join();

        { std::lock_guard<std::mutex> io(cout_mtx); std::cout << "\n"; }
        std::cout << "Done in " << std::fixed << std::setprecision(2) << sw.total() << " s\n";
        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 1;
    }
}
