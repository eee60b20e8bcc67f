#pragma once
// Register array for LogLog-family sketches, packed 6 bits per register.
// Register i occupies bits [6i, 6i+6) of a little-endian bit stream held in
// 64-bit words; a register may straddle two words. All registers start at 0.
//
//   sketch::RegisterArray r(1u << 10);
//   r.raise(3, 7);          // r.get(3) == 7
//   r.raise(3, 2);          // still 7

#include <cstdint>
#include <cstddef>
#include <vector>
#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

#ifndef LLB_FORCEINLINE
#if defined(_MSC_VER)
#define LLB_FORCEINLINE __forceinline
#elif defined(__clang__) || defined(__GNUC__)
#define LLB_FORCEINLINE inline __attribute__((always_inline))
#else
#define LLB_FORCEINLINE inline
#endif
#endif

namespace sketch {

    class RegisterArray {
    public:
        static constexpr unsigned WIDTH = 6;
        static constexpr std::uint8_t MAX_VALUE = (1u << WIDTH) - 1;  // 63

        explicit RegisterArray(std::size_t m)
            : m_(m), words_((m * WIDTH + 63) / 64, 0)
        {
            if (m_ == 0) throw std::invalid_argument("RegisterArray: m must be > 0");
        }

        // Adopt packed storage as laid out by words(). Throws on a wrong word count
        // or on stray bits past the last register.
        static RegisterArray from_words(std::size_t m, std::vector<std::uint64_t> words) {
            RegisterArray out(m);
            if (words.size() != out.words_.size())
                throw std::invalid_argument("RegisterArray: expected " + std::to_string(out.words_.size()) +
                    " words, got " + std::to_string(words.size()));
            const unsigned used = static_cast<unsigned>((m * WIDTH) & 63);
            if (used != 0 && (words.back() >> used) != 0)
                throw std::invalid_argument("RegisterArray: nonzero padding bits");
            out.words_ = std::move(words);
            return out;
        }

        LLB_FORCEINLINE std::size_t size() const { return m_; }

        LLB_FORCEINLINE std::uint8_t get(std::size_t i) const {
            const std::size_t bit = i * WIDTH;
            const std::size_t w = bit >> 6;
            const unsigned off = static_cast<unsigned>(bit & 63);
            std::uint64_t v = words_[w] >> off;
            if (off > 64 - WIDTH) v |= words_[w + 1] << (64 - off);
            return static_cast<std::uint8_t>(v & MAX_VALUE);
        }

        // register[i] = max(register[i], rank). Ranks above MAX_VALUE saturate.
        LLB_FORCEINLINE void raise(std::size_t i, std::uint8_t rank) {
            if (rank > MAX_VALUE) rank = MAX_VALUE;
            if (rank > get(i)) set(i, rank);
        }

        // New array holding the larger of the two registers at every index.
        RegisterArray pointwise_max(const RegisterArray& other) const {
            if (other.m_ != m_) throw std::invalid_argument("RegisterArray: pointwise_max of mismatched sizes");
            RegisterArray out(*this);
            for (std::size_t i = 0; i < m_; ++i) out.raise(i, other.get(i));
            return out;
        }

        std::size_t count_zeros() const {
            std::size_t z = 0;
            for (std::size_t i = 0; i < m_; ++i) z += (get(i) == 0);
            return z;
        }

        std::uint8_t max_value() const {
            std::uint8_t hi = 0;
            for (std::size_t i = 0; i < m_; ++i) hi = std::max(hi, get(i));
            return hi;
        }

        // Packed storage, (6m + 63) / 64 words; bits past register m-1 are zero.
        LLB_FORCEINLINE const std::vector<std::uint64_t>& words() const { return words_; }

        bool operator==(const RegisterArray& o) const { return m_ == o.m_ && words_ == o.words_; }
        bool operator!=(const RegisterArray& o) const { return !(*this == o); }

    private:
        LLB_FORCEINLINE void set(std::size_t i, std::uint8_t v) {
            const std::size_t bit = i * WIDTH;
            const std::size_t w = bit >> 6;
            const unsigned off = static_cast<unsigned>(bit & 63);
            words_[w] = (words_[w] & ~(std::uint64_t(MAX_VALUE) << off)) | (std::uint64_t(v) << off);
            if (off > 64 - WIDTH) {
                const unsigned spill = off + WIDTH - 64;  // bits in the next word
                const std::uint64_t mask = (std::uint64_t(1) << spill) - 1;
                words_[w + 1] = (words_[w + 1] & ~mask) | (std::uint64_t(v) >> (64 - off));
            }
        }

        std::size_t m_;
        std::vector<std::uint64_t> words_;
    };

} // namespace sketch
