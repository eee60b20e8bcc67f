#pragma once
// datasets/keys.hpp
// Synthetic 64-bit integer keys with a known distinct count.
// - Keys(n, repeats, first, seed): keys first..first+n-1, each written 'repeats'
//   times, optionally shuffled by a seeded Fisher-Yates pass.
// - KeysSplit(n, seed): the same n distinct keys divided into two DISJOINT groups
//   (A/B) by a seeded coin per key, for union/merge experiments.
// Fully materialized; 8-byte little-endian records.
//
// Provides:
//   datasets::Keys, datasets::KeysSplit
//   datasets::StreamU64   -> Stream over the buffer, len==8

#include <cstdint>
#include <cstddef>
#include <vector>
#include <utility>
#include <stdexcept>

#include "core/dataset.hpp"
#include "core/randomgen.hpp"
#include "core/unaligned.hpp"

namespace datasets {

    // ---------- pointer-size block stream over a contiguous 8B-key buffer ----------
    class StreamU64 final : public Stream {
    public:
        StreamU64() = default;
        StreamU64(const std::uint8_t* base, std::size_t n_items)
            : base_(base), n_(n_items) {
        }

        bool next(const void*& out_ptr, std::size_t& out_len) override {
            if (i_ >= n_) return false;
            out_ptr = base_ + (i_ * 8);
            out_len = 8;
            ++i_;
            return true;
        }

        void reset() override { i_ = 0; }
        std::size_t size_hint() const override { return n_; }

    private:
        const std::uint8_t* base_ = nullptr;
        std::size_t n_ = 0;
        std::size_t i_ = 0;
    };

    // ---------- Keys: n distinct keys, each repeated, optionally shuffled ----------
    class Keys {
    public:
        explicit Keys(std::size_t n_distinct, std::size_t repeats = 1,
            std::uint64_t first = 0, std::uint64_t shuffle_seed = 0)
            : distinct_(n_distinct), N_(n_distinct * repeats), buf_(N_ * 8)
        {
            if (n_distinct == 0 || repeats == 0)
                throw std::invalid_argument("Keys: n_distinct and repeats must be > 0");
            std::size_t pos = 0;
            for (std::size_t r = 0; r < repeats; ++r)
                for (std::uint64_t k = first; k < first + n_distinct; ++k)
                    PUT_U64(buf_.data() + 8 * pos++, k);
            if (shuffle_seed != 0) shuffle(shuffle_seed);
        }

        std::size_t size() const { return N_; }
        std::size_t distinct() const { return distinct_; }
        std::uint64_t key(std::size_t i) const { return GET_U64(buf_.data(), static_cast<std::uint32_t>(8 * i)); }
        const std::vector<std::uint8_t>& buffer() const { return buf_; }

        StreamU64 make_stream() const { return StreamU64(buf_.data(), N_); }

    private:
        void shuffle(std::uint64_t seed) {
            for (std::size_t i = N_; i > 1; --i) {
                const std::size_t j = static_cast<std::size_t>(rng::splitmix64(seed) % i);
                for (int b = 0; b < 8; ++b) std::swap(buf_[8 * (i - 1) + b], buf_[8 * j + b]);
            }
        }

        std::size_t distinct_;
        std::size_t N_;
        std::vector<std::uint8_t> buf_;
    };

    // ---------- KeysSplit: disjoint A/B groups of one distinct key range ----------
    class KeysSplit {
    public:
        KeysSplit(std::size_t n_distinct, std::uint64_t split_seed, std::uint64_t first = 0) {
            if (n_distinct == 0) throw std::invalid_argument("KeysSplit: n_distinct must be > 0");
            for (std::uint64_t k = first; k < first + n_distinct; ++k) {
                std::uint64_t s = split_seed ^ k;
                auto& dst = (rng::splitmix64(s) & 1ull) ? B_buf_ : A_buf_;
                const std::size_t off = dst.size();
                dst.resize(off + 8);
                PUT_U64(dst.data() + off, k);
            }
        }

        std::size_t sizeA() const { return A_buf_.size() / 8; }
        std::size_t sizeB() const { return B_buf_.size() / 8; }

        StreamU64 make_streamA() const { return StreamU64(A_buf_.data(), sizeA()); }
        StreamU64 make_streamB() const { return StreamU64(B_buf_.data(), sizeB()); }

    private:
        std::vector<std::uint8_t> A_buf_, B_buf_;
    };

} // namespace datasets
