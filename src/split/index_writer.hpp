#pragma once
#include <fmt/format.h>
#include <cstdint>
#include <filesystem>
#include <iterator>
#include <optional>
#include <string_view>
#include <utility>

#include "../io/output_file.hpp"

namespace csvsplit {

// Sparse record index: one "<record_num>\t<byte_offset>\n" line per split
// boundary, byte_offset being the input offset just past the terminating LF.
class index_writer {
public:
    // Throws output_exists_error if `p` is already there.
    static index_writer open(const std::filesystem::path& p) {
        std::optional<output_file> f = output_file::create_exclusive(p);
        if (!f) throw output_exists_error(p);
        return index_writer(std::move(*f));
    }

    void add(std::uint64_t record_num, std::uint64_t byte_offset) {
        fmt::memory_buffer line;
        fmt::format_to(std::back_inserter(line), "{}\t{}\n", record_num, byte_offset);
        out_.write(std::string_view(line.data(), line.size()));
        ++entries_;
    }

    void close() { out_.close(); }

    std::uint64_t entries() const noexcept { return entries_; }
    const std::filesystem::path& path() const noexcept { return out_.path(); }

private:
    explicit index_writer(output_file f) : out_(std::move(f)) {}

    output_file out_;
    std::uint64_t entries_ = 0;
};

}
