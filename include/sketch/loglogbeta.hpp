#pragma once
// LogLog-Beta distinct counting sketch.
// Qin, Kim, Tung, "LogLog-Beta and More: A New Algorithm for Cardinality
// Estimation Based on LogLog Counting" (2016): https://arxiv.org/abs/1612.02284
//
// m = 2^p registers. A 64-bit hash h selects register h >> (64-p); the rank is
// 1 + leading zeros of the other 64-p bits (W = 65-p when they are all zero).
// Estimate:  E = alpha_inf * m * (m - z) / (beta(z) + sum_i 2^-M[i]),  z = #empty.
// Unlike HyperLogLog there is no small/large range switch; beta(z) absorbs the bias.
//
// The hasher is any type with  std::uint64_t hash(const void*, std::size_t) const;
// sketches are only comparable/mergeable when built with identically seeded hashers.
//
//   sketch::LogLogBeta<> llb(0.01);            // ~1% standard error, p = 14
//   llb.insert(std::string_view("alice"));
//   llb.insert(std::uint64_t{42});
//   double n = llb.estimate();

#include <array>
#include <bit>
#include <cmath>
#include <cstdint>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "hash/rapidhash64.hpp"
#include "sketch/registers.hpp"

namespace sketch {

    // Error rate outside (0,1), or one that maps outside the supported precisions.
    struct InvalidErrorRate : std::invalid_argument {
        using std::invalid_argument::invalid_argument;
    };

    struct InvalidPrecision : std::invalid_argument {
        using std::invalid_argument::invalid_argument;
    };

    // Merge of sketches with different register counts. Neither side is modified.
    struct PrecisionMismatch : std::invalid_argument {
        using std::invalid_argument::invalid_argument;
    };

    template <class Hasher = hashfn::RapidHash64>
    class LogLogBeta {
    public:
        using hasher_type = Hasher;

        static constexpr std::uint8_t MIN_PRECISION = 4;
        static constexpr std::uint8_t MAX_PRECISION = 18;
        static constexpr double ALPHA_INF = 0.72134752044448170368;  // 0.5 / ln(2)

        // beta(z) = B[0]*z + sum_{k=1..7} B[k]*ln(z+1)^k
        static constexpr std::array<double, 8> BETA = {
            -0.370393911, 0.070471823, 0.17393686, 0.16339839,
            -0.09237745,  0.03738027, -0.005384159, 0.00042419
        };

        explicit LogLogBeta(double error_rate, Hasher hasher = Hasher{})
            : LogLogBeta(precision_for(error_rate), std::move(hasher), Unchecked{}) {
        }

        static LogLogBeta with_precision(unsigned p, Hasher hasher = Hasher{}) {
            check_precision(p);
            return LogLogBeta(static_cast<std::uint8_t>(p), std::move(hasher), Unchecked{});
        }

        // Rebuild a sketch from a register array (e.g. one read back from bytes).
        static LogLogBeta from_registers(RegisterArray regs, Hasher hasher = Hasher{}) {
            const std::size_t m = regs.size();
            if ((m & (m - 1)) != 0)
                throw InvalidPrecision("LogLogBeta: register count " + std::to_string(m) + " is not a power of two");
            const unsigned p = static_cast<unsigned>(std::countr_zero(m));
            check_precision(p);
            if (regs.max_value() > max_rank(static_cast<std::uint8_t>(p)))
                throw std::invalid_argument("LogLogBeta: register value exceeds 65-p");
            LogLogBeta out(static_cast<std::uint8_t>(p), std::move(hasher), Unchecked{});
            out.registers_ = std::move(regs);
            return out;
        }

        // p = ceil(log2((1.04 / error_rate)^2)), rejected outside [MIN_PRECISION, MAX_PRECISION].
        static std::uint8_t precision_for(double error_rate) {
            if (!(error_rate > 0.0 && error_rate < 1.0))
                throw InvalidErrorRate("LogLogBeta: error rate must be in (0,1), got " + std::to_string(error_rate));
            const double p = std::ceil(std::log2(std::pow(1.04 / error_rate, 2.0)));
            if (!(p >= MIN_PRECISION && p <= MAX_PRECISION))
                throw InvalidErrorRate("LogLogBeta: error rate " + std::to_string(error_rate) +
                    " needs precision " + std::to_string(p) + ", supported range is [" +
                    std::to_string(MIN_PRECISION) + "," + std::to_string(MAX_PRECISION) + "]");
            return static_cast<std::uint8_t>(p);
        }

        // Largest rank a register can hold at precision p.
        static constexpr std::uint8_t max_rank(std::uint8_t p) { return static_cast<std::uint8_t>(64 - p + 1); }

        static double beta(double z) {
            const double zl = std::log(z + 1.0);
            double poly = 0.0, x = 1.0;
            for (std::size_t k = 1; k < BETA.size(); ++k) {
                x *= zl;
                poly += BETA[k] * x;
            }
            return BETA[0] * z + poly;
        }

        // Insert an already-hashed 64-bit value.
        void push(std::uint64_t h) {
            const std::size_t idx = static_cast<std::size_t>(h >> (64 - p_));
            const std::uint64_t w = h << p_;  // remaining 64-p bits, left-aligned
            const std::uint8_t rank = (w == 0)
                ? max_rank(p_)
                : static_cast<std::uint8_t>(std::countl_zero(w) + 1);
            registers_.raise(idx, rank);
        }

        void insert(const void* key, std::size_t len) { push(hasher_.hash(key, len)); }

        // Strings hash their characters; other items hash their object bytes.
        template <class T>
        void insert(const T& item) {
            if constexpr (std::is_convertible_v<const T&, std::string_view>) {
                const std::string_view s(item);
                insert(s.data(), s.size());
            }
            else {
                static_assert(std::is_trivially_copyable_v<T> && !std::is_pointer_v<T> &&
                    (std::has_unique_object_representations_v<T> || std::is_floating_point_v<T>),
                    "LogLogBeta::insert needs a string or a padding-free trivially copyable value");
                insert(static_cast<const void*>(std::addressof(item)), sizeof(T));
            }
        }

        double estimate() const {
            const std::size_t m = registers_.size();
            std::size_t zeros = 0;
            double sum = 0.0;
            for (std::size_t i = 0; i < m; ++i) {
                const std::uint8_t r = registers_.get(i);
                zeros += (r == 0);
                sum += std::ldexp(1.0, -static_cast<int>(r));
            }
            if (zeros == m) return 0.0;

            const double ms = static_cast<double>(m);
            const double z = static_cast<double>(zeros);
            const double est = ALPHA_INF * ms * (ms - z) / (beta(z) + sum);
            return est > 0.0 ? est : 0.0;
        }

        // registers = max(registers, other.registers). Throws before touching anything.
        void merge(const LogLogBeta& other) {
            if (other.p_ != p_)
                throw PrecisionMismatch("LogLogBeta: cannot merge precision " + std::to_string(other.p_) +
                    " into precision " + std::to_string(p_));
            registers_ = registers_.pointwise_max(other.registers_);
        }

        unsigned precision() const { return p_; }
        std::size_t size() const { return registers_.size(); }
        const RegisterArray& registers() const { return registers_; }
        const Hasher& hasher() const { return hasher_; }

    private:
        struct Unchecked {};

        LogLogBeta(std::uint8_t p, Hasher hasher, Unchecked)
            : p_(p), registers_(std::size_t(1) << p), hasher_(std::move(hasher)) {
        }

        static void check_precision(unsigned p) {
            if (p < MIN_PRECISION || p > MAX_PRECISION)
                throw InvalidPrecision("LogLogBeta: precision " + std::to_string(p) + " outside [" +
                    std::to_string(MIN_PRECISION) + "," + std::to_string(MAX_PRECISION) + "]");
        }

        std::uint8_t p_;
        RegisterArray registers_;
        Hasher hasher_;
    };

    // Union of two sketches as a new value; a and b are left unchanged.
    template <class Hasher>
    LogLogBeta<Hasher> merged(const LogLogBeta<Hasher>& a, const LogLogBeta<Hasher>& b) {
        LogLogBeta<Hasher> out(a);
        out.merge(b);
        return out;
    }

} // namespace sketch
