/*
 * SipHash-2-4 as described by Aumasson and Bernstein, "SipHash: a fast
 * short-input PRF" (2012): https://131002.net/siphash/siphash.pdf
 * 128-bit key (k0,k1), any-length input, 64-bit output.
 */

#pragma once
// Keyed 64-bit hash for any byte string.
// Single config entry point: set_params(k0, k1)

#include <cstdint>
#include <cstddef>
#include <core/unaligned.hpp>

// ---- force-inline macro (local, guarded) -----------------------------------
#ifndef LLB_FORCEINLINE
#if defined(_MSC_VER)
#define LLB_FORCEINLINE __forceinline
#elif defined(__clang__) || defined(__GNUC__)
#define LLB_FORCEINLINE inline __attribute__((always_inline))
#else
#define LLB_FORCEINLINE inline
#endif
#endif
// ---------------------------------------------------------------------------

namespace hashfn {

    struct SipHash24 {
        SipHash24() = default;
        SipHash24(std::uint64_t k0, std::uint64_t k1) { set_params(k0, k1); }

        LLB_FORCEINLINE void set_params(std::uint64_t k0, std::uint64_t k1) {
            k0_ = k0;
            k1_ = k1;
        }

        LLB_FORCEINLINE std::uint64_t hash(const void* in, std::size_t len) const {
            const std::uint8_t* buf = static_cast<const std::uint8_t*>(in);
            std::uint64_t v0 = k0_ ^ 0x736f6d6570736575ull;
            std::uint64_t v1 = k1_ ^ 0x646f72616e646f6dull;
            std::uint64_t v2 = k0_ ^ 0x6c7967656e657261ull;
            std::uint64_t v3 = k1_ ^ 0x7465646279746573ull;

            const std::size_t full = len & ~std::size_t(7);
            for (std::size_t i = 0; i < full; i += 8) {
                const std::uint64_t m = GET_U64(buf + i, 0);
                v3 ^= m;
                round(v0, v1, v2, v3);
                round(v0, v1, v2, v3);
                v0 ^= m;
            }

            // Last block: remaining bytes plus the input length in the top byte.
            const std::uint64_t b = (static_cast<std::uint64_t>(len) << 56) | GET_TAIL(buf + full, len - full);
            v3 ^= b;
            round(v0, v1, v2, v3);
            round(v0, v1, v2, v3);
            v0 ^= b;

            v2 ^= 0xff;
            round(v0, v1, v2, v3);
            round(v0, v1, v2, v3);
            round(v0, v1, v2, v3);
            round(v0, v1, v2, v3);
            return v0 ^ v1 ^ v2 ^ v3;
        }

        LLB_FORCEINLINE std::uint64_t k0() const { return k0_; }
        LLB_FORCEINLINE std::uint64_t k1() const { return k1_; }

    private:
        static LLB_FORCEINLINE std::uint64_t rotl(std::uint64_t x, int b) {
            return (x << b) | (x >> (64 - b));
        }

        static LLB_FORCEINLINE void round(std::uint64_t& v0, std::uint64_t& v1,
            std::uint64_t& v2, std::uint64_t& v3) {
            v0 += v1; v1 = rotl(v1, 13); v1 ^= v0; v0 = rotl(v0, 32);
            v2 += v3; v3 = rotl(v3, 16); v3 ^= v2;
            v0 += v3; v3 = rotl(v3, 21); v3 ^= v0;
            v2 += v1; v1 = rotl(v1, 17); v1 ^= v2; v2 = rotl(v2, 32);
        }

        std::uint64_t k0_{ 0 };
        std::uint64_t k1_{ 0 };
    };

} // namespace hashfn
