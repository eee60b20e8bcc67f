/*
 * Process-wide seed source for hash parameters (SipHash keys, rapidhash seeds).
 * Same shape as the file-backed pool in https://github.com/kipoujr/no_repetition,
 * but the stream is splitmix64 from a single 64-bit seed so runs are
 * reproducible without shipping seed files.
 */

#pragma once
#ifndef LLB_DEFAULT_SEED
// Define the default seed if not defined by build system
#define LLB_DEFAULT_SEED 0x9E3779B97F4A7C15ull
#endif
#include <cstdint>
#include <cstddef>
#include <mutex>

namespace rng {

    // splitmix64 step: advances 'state' and returns the next output.
    inline std::uint64_t splitmix64(std::uint64_t& state) {
        std::uint64_t z = (state += 0x9E3779B97F4A7C15ull);
        z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ull;
        z = (z ^ (z >> 27)) * 0x94D049BB133111EBull;
        return z ^ (z >> 31);
    }

    class RandomPool {
    public:
        static RandomPool& instance() {
            static RandomPool inst;
            return inst;
        }

        // Restart the stream; draws after this are a pure function of 'seed'.
        void seed(std::uint64_t s) {
            std::scoped_lock lk(mu_);
            state_ = s;
        }

        std::uint64_t u64() { std::scoped_lock lk(mu_); return splitmix64(state_); }
        std::uint32_t u32() { return static_cast<std::uint32_t>(u64() >> 32); }

    private:
        RandomPool() = default;

        mutable std::mutex mu_;
        std::uint64_t state_{ LLB_DEFAULT_SEED };
    };

    // Convenience wrappers
    inline void          reseed(std::uint64_t s) { RandomPool::instance().seed(s); }
    inline std::uint32_t get_u32() { return RandomPool::instance().u32(); }
    inline std::uint64_t get_u64() { return RandomPool::instance().u64(); }

} // namespace rng
