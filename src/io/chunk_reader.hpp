#pragma once
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <vector>
#include <string_view>
#include <cstdint>
#include <stdexcept>

#include "../util/errors.hpp"

namespace csvsplit {

inline constexpr std::size_t default_chunk_bytes = std::size_t{1} << 20;  // 1 MiB

// Reads a file in fixed-size binary blocks and keeps track of where the
// next block starts in the file.
class chunk_reader {
public:
    chunk_reader(const std::filesystem::path& p, std::size_t chunk_bytes = default_chunk_bytes)
        : path_(p), buf_(chunk_bytes)
    {
        if (chunk_bytes == 0) throw std::invalid_argument("chunk_bytes == 0");
        in_.open(path_, std::ios::binary);
        if (!in_) throw io_error(describe_errno("failed to open input", path_, errno));
    }

    // Next block; empty view = EOF. The view stays valid until the next call.
    std::string_view next() {
        if (!in_) return {};
        in_.read(buf_.data(), static_cast<std::streamsize>(buf_.size()));
        if (in_.bad()) throw io_error(describe_errno("read failed", path_, errno));
        const auto got = static_cast<std::size_t>(in_.gcount());
        chunk_start_ = offset_;
        offset_ += got;
        return std::string_view(buf_.data(), got);
    }

    // Absolute offset of the first byte of the block last returned by next().
    std::uint64_t chunk_start() const noexcept { return chunk_start_; }

    // Bytes consumed so far.
    std::uint64_t offset() const noexcept { return offset_; }

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::ifstream in_;
    std::vector<char> buf_;
    std::uint64_t chunk_start_ = 0;
    std::uint64_t offset_ = 0;
};

}
