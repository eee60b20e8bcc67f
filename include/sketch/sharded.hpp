#pragma once
// Multi-threaded use of LogLogBeta.
//
// build_sharded: each worker fills a private sketch over one contiguous chunk of
// the input, then the partial sketches are merged on the calling thread. No
// register is ever shared between threads, and because merge is a pointwise max
// the result equals a serial build register for register.
//
// LockedLogLogBeta: one sketch shared by several threads behind a mutex.

#include <algorithm>
#include <cstdint>
#include <cstddef>
#include <mutex>
#include <span>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include "sketch/loglogbeta.hpp"

namespace sketch {

    // Fold of pairwise merges. Throws PrecisionMismatch at the first incompatible sketch.
    template <class Hasher>
    LogLogBeta<Hasher> merge_all(std::span<const LogLogBeta<Hasher>> parts) {
        if (parts.empty()) throw std::invalid_argument("merge_all: no sketches");
        LogLogBeta<Hasher> out(parts.front());
        for (std::size_t i = 1; i < parts.size(); ++i) out.merge(parts[i]);
        return out;
    }

    template <class Hasher, class T>
    LogLogBeta<Hasher> build_sharded(std::span<const T> items, unsigned p, unsigned threads,
        const Hasher& hasher = Hasher{})
    {
        if (threads == 0) threads = 1;
        if (items.size() < threads) threads = items.empty() ? 1u : static_cast<unsigned>(items.size());

        std::vector<LogLogBeta<Hasher>> parts;
        parts.reserve(threads);
        for (unsigned t = 0; t < threads; ++t) parts.push_back(LogLogBeta<Hasher>::with_precision(p, hasher));

        const std::size_t chunk = (items.size() + threads - 1) / threads;
        auto worker = [&](unsigned tid) {
            const std::size_t lo = std::min(items.size(), tid * chunk);
            const std::size_t hi = std::min(items.size(), lo + chunk);
            for (std::size_t i = lo; i < hi; ++i) parts[tid].insert(items[i]);
            };

        // Launch pool
        std::vector<std::thread> pool; pool.reserve(threads);
        for (unsigned t = 0; t < threads; ++t) pool.emplace_back(worker, t);
        for (auto& th : pool) th.join();

        return merge_all(std::span<const LogLogBeta<Hasher>>(parts));
    }

    template <class Hasher = hashfn::RapidHash64>
    class LockedLogLogBeta {
    public:
        explicit LockedLogLogBeta(LogLogBeta<Hasher> sketch) : sketch_(std::move(sketch)) {}

        template <class T>
        void insert(const T& item) {
            std::scoped_lock lk(mu_);
            sketch_.insert(item);
        }

        void push(std::uint64_t h) {
            std::scoped_lock lk(mu_);
            sketch_.push(h);
        }

        // Point-in-time estimate: no insert can interleave with the register scan.
        double estimate() const {
            std::scoped_lock lk(mu_);
            return sketch_.estimate();
        }

        void merge(const LogLogBeta<Hasher>& other) {
            std::scoped_lock lk(mu_);
            sketch_.merge(other);
        }

        LogLogBeta<Hasher> snapshot() const {
            std::scoped_lock lk(mu_);
            return sketch_;
        }

    private:
        mutable std::mutex mu_;
        LogLogBeta<Hasher> sketch_;
    };

} // namespace sketch
