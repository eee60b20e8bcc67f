#pragma once
// RapidHash64: seeded 64-bit rapidhash (https://github.com/Nicoshev/rapidhash, v1 API)
// over any-length input. Default hasher of sketch::LogLogBeta.
//
//   hashfn::RapidHash64 h;  h.set_params(seed);
//   std::uint64_t v = h.hash(ptr, len);

#include <cstdint>
#include <cstddef>

#include <rapidhash.h>

#ifndef LLB_FORCEINLINE
#if defined(_MSC_VER)
#define LLB_FORCEINLINE __forceinline
#elif defined(__clang__) || defined(__GNUC__)
#define LLB_FORCEINLINE inline __attribute__((always_inline))
#else
#define LLB_FORCEINLINE inline
#endif
#endif

namespace hashfn {

    struct RapidHash64 {
        RapidHash64() = default;
        explicit RapidHash64(std::uint64_t seed) : seed_(seed) {}

        LLB_FORCEINLINE void set_params(std::uint64_t seed) { seed_ = seed; }

        LLB_FORCEINLINE std::uint64_t hash(const void* key, std::size_t len) const {
            return rapidhash_withSeed(key, len, seed_);
        }

        LLB_FORCEINLINE std::uint64_t seed() const { return seed_; }

    private:
        std::uint64_t seed_{ RAPID_SEED };
    };

} // namespace hashfn
