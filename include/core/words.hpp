#pragma once
// datasets/words.hpp
// Words: whitespace-separated tokens read from a file or any std::istream.
// - Each word is materialized as raw bytes in a flat buffer; we store (offset,len) pairs.
// - Streaming API yields (ptr,len) for each word, duplicates included, in input order.
// - An optional limit stops reading after that many words (0 = read everything).

#include <cstdint>
#include <cstddef>
#include <vector>
#include <string>
#include <string_view>
#include <istream>
#include <fstream>
#include <stdexcept>

#include "core/dataset.hpp"

namespace datasets {

    // -------- variable-length stream over (flat bytes + (offset,len) pairs) --------
    class StreamVar final : public Stream {
    public:
        StreamVar() = default;
        StreamVar(const std::uint8_t* base, const std::vector<std::pair<std::uint64_t, std::uint32_t>>* idx)
            : base_(base), idx_(idx) {
        }

        bool next(const void*& out_ptr, std::size_t& out_len) override {
            if (!idx_ || i_ >= idx_->size()) return false;
            const auto [off, len] = (*idx_)[i_++];
            out_ptr = base_ + off;
            out_len = len;
            return true;
        }

        void reset() override { i_ = 0; }
        std::size_t size_hint() const override { return idx_ ? idx_->size() : 0; }

    private:
        const std::uint8_t* base_ = nullptr;
        const std::vector<std::pair<std::uint64_t, std::uint32_t>>* idx_ = nullptr;
        std::size_t i_ = 0;
    };

    class Words {
    public:
        explicit Words(const std::string& path, std::size_t limit = 0) {
            std::ifstream in(path);
            if (!in) throw std::runtime_error("Words: cannot open file: " + path);
            read(in, limit);
        }

        explicit Words(std::istream& in, std::size_t limit = 0) { read(in, limit); }

        std::size_t size() const { return idx_.size(); }
        std::size_t bytes() const { return buf_.size(); }

        std::string_view word(std::size_t i) const {
            const auto [off, len] = idx_[i];
            return std::string_view(reinterpret_cast<const char*>(buf_.data() + off), len);
        }

        // One view per word; views stay valid while this object lives.
        std::vector<std::string_view> views() const {
            std::vector<std::string_view> out;
            out.reserve(idx_.size());
            for (std::size_t i = 0; i < idx_.size(); ++i) out.push_back(word(i));
            return out;
        }

        StreamVar make_stream() const { return StreamVar(buf_.data(), &idx_); }

    private:
        void read(std::istream& in, std::size_t limit) {
            std::string token;
            while (in >> token) {
                const std::uint64_t off = buf_.size();
                buf_.insert(buf_.end(), token.begin(), token.end());
                idx_.emplace_back(off, static_cast<std::uint32_t>(token.size()));
                if (limit != 0 && idx_.size() == limit) break;
            }
            if (in.bad()) throw std::runtime_error("Words: read error");
        }

        std::vector<std::uint8_t> buf_;
        std::vector<std::pair<std::uint64_t, std::uint32_t>> idx_;
    };

} // namespace datasets
