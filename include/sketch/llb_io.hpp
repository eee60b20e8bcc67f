#pragma once
// Byte layout of a LogLog-Beta register array, for files and network transfer.
//
//   offset 0 : "LLB1"                     magic
//   offset 4 : p                          one byte, 4..18
//   offset 5 : registers                  6*m/8 bytes, register i at bits [6i, 6i+6)
//                                         of a little-endian bit stream
//
// The hasher is not part of the layout: a sketch read back only merges
// meaningfully with sketches built by an identically seeded hasher.

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <fstream>
#include <iterator>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "core/unaligned.hpp"
#include "sketch/loglogbeta.hpp"

namespace sketch {

    struct CorruptSketch : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    inline constexpr char LLB_MAGIC[4] = { 'L', 'L', 'B', '1' };
    inline constexpr std::size_t LLB_HEADER_BYTES = 5;

    inline std::size_t packed_bytes(std::size_t m) { return (m * RegisterArray::WIDTH + 7) / 8; }

    template <class Hasher>
    std::vector<std::uint8_t> to_bytes(const LogLogBeta<Hasher>& s) {
        const std::size_t nbytes = packed_bytes(s.size());
        std::vector<std::uint8_t> out(LLB_HEADER_BYTES + nbytes);
        std::memcpy(out.data(), LLB_MAGIC, sizeof(LLB_MAGIC));
        out[4] = static_cast<std::uint8_t>(s.precision());

        std::uint8_t word[8];
        const auto& words = s.registers().words();
        for (std::size_t i = 0; i < nbytes; ++i) {
            if ((i & 7) == 0) PUT_U64(word, words[i >> 3]);
            out[LLB_HEADER_BYTES + i] = word[i & 7];
        }
        return out;
    }

    template <class Hasher = hashfn::RapidHash64>
    LogLogBeta<Hasher> from_bytes(std::span<const std::uint8_t> in, Hasher hasher = Hasher{}) {
        if (in.size() < LLB_HEADER_BYTES || std::memcmp(in.data(), LLB_MAGIC, sizeof(LLB_MAGIC)) != 0)
            throw CorruptSketch("LLB: missing magic");
        const unsigned p = in[4];
        if (p < LogLogBeta<Hasher>::MIN_PRECISION || p > LogLogBeta<Hasher>::MAX_PRECISION)
            throw CorruptSketch("LLB: precision " + std::to_string(p) + " out of range");

        const std::size_t m = std::size_t(1) << p;
        const std::size_t nbytes = packed_bytes(m);
        if (in.size() != LLB_HEADER_BYTES + nbytes)
            throw CorruptSketch("LLB: expected " + std::to_string(LLB_HEADER_BYTES + nbytes) +
                " bytes, got " + std::to_string(in.size()));

        std::vector<std::uint64_t> words((m * RegisterArray::WIDTH + 63) / 64, 0);
        const std::uint8_t* body = in.data() + LLB_HEADER_BYTES;
        for (std::size_t w = 0; w < words.size(); ++w) {
            const std::size_t off = w * 8;
            words[w] = (off + 8 <= nbytes) ? GET_U64(body + off, 0) : GET_TAIL(body + off, nbytes - off);
        }

        try {
            return LogLogBeta<Hasher>::from_registers(RegisterArray::from_words(m, std::move(words)), std::move(hasher));
        }
        catch (const std::invalid_argument& e) {
            throw CorruptSketch(std::string("LLB: ") + e.what());
        }
    }

    template <class Hasher>
    void save(const std::string& path, const LogLogBeta<Hasher>& s) {
        const auto bytes = to_bytes(s);
        std::ofstream f(path, std::ios::binary);
        if (!f) throw std::runtime_error("LLB: cannot open " + path);
        f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!f) throw std::runtime_error("LLB: write failed: " + path);
    }

    template <class Hasher = hashfn::RapidHash64>
    LogLogBeta<Hasher> load(const std::string& path, Hasher hasher = Hasher{}) {
        std::ifstream f(path, std::ios::binary);
        if (!f) throw std::runtime_error("LLB: cannot open " + path);
        std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        if (f.bad()) throw std::runtime_error("LLB: read failed: " + path);
        return from_bytes<Hasher>(bytes, std::move(hasher));
    }

} // namespace sketch
