#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

#include "../io/chunk_reader.hpp"
#include "index_writer.hpp"
#include "split_writer.hpp"

namespace csvsplit {

inline constexpr std::uint64_t default_num_per_split = 100000;

struct split_options {
    std::filesystem::path input;
    std::filesystem::path output_dir;   // empty: beside the input
    std::filesystem::path index_path;   // empty: no index
    std::uint64_t num_per_split = default_num_per_split;
    std::size_t chunk_bytes = default_chunk_bytes;
};

struct split_result {
    std::uint64_t records = 0;
    std::uint64_t files = 0;
    std::uint64_t bytes_in = 0;
    std::uint64_t index_entries = 0;
    std::vector<std::filesystem::path> split_paths;
};

/**
 * Splits opt.input into files of opt.num_per_split records each.
 *
 * Nothing is created for an empty input. Otherwise the index (if requested)
 * is created first, so an existing index file aborts the run before any
 * split file exists. Every handle is owned by a local object, so input,
 * index and split files are closed on both the normal and the error path.
 *
 * @param on_rotate  called after each rotation; may be empty.
 * @throws io_error, output_exists_error, std::invalid_argument
 */
inline split_result run_split(const split_options& opt,
                              split_writer::rotate_fn on_rotate = {})
{
    if (opt.num_per_split == 0) throw std::invalid_argument("num_per_split must be > 0");
    if (opt.chunk_bytes == 0) throw std::invalid_argument("chunk_bytes must be > 0");

    chunk_reader in(opt.input, opt.chunk_bytes);
    std::string_view chunk = in.next();

    split_result res;
    if (chunk.empty()) return res;

    std::optional<index_writer> index;
    if (!opt.index_path.empty()) index.emplace(index_writer::open(opt.index_path));

    split_writer out(opt.input, opt.output_dir, opt.num_per_split,
                     index ? &*index : nullptr, std::move(on_rotate));
    out.start();
    while (!chunk.empty()) {
        out.consume(chunk, in.chunk_start());
        chunk = in.next();
    }
    out.finish();
    if (index) {
        index->close();
        res.index_entries = index->entries();
    }

    res.records     = out.records();
    res.files       = out.files();
    res.bytes_in    = out.bytes_in();
    res.split_paths = out.paths();
    return res;
}

}
