#pragma once
#include <fmt/format.h>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

#include "output_file.hpp"

namespace csvsplit {

inline constexpr int split_seq_width = 6;

// <stem>_<seq:06><ext>, beside the input or inside output_dir when given.
//   data/big.csv, seq 7           -> data/big_000007.csv
//   data/big.csv, out/, seq 7     -> out/big_000007.csv
inline std::filesystem::path split_path(const std::filesystem::path& input,
                                        const std::filesystem::path& output_dir,
                                        std::uint64_t seq)
{
    const std::string name = fmt::format("{}_{:0{}}{}",
                                         input.stem().string(), seq, split_seq_width,
                                         input.extension().string());
    const std::filesystem::path dir = output_dir.empty() ? input.parent_path() : output_dir;
    return dir / name;
}

// big_000007.csv, n=2 -> big_000007_2.csv
inline std::filesystem::path disambiguated_path(const std::filesystem::path& candidate,
                                                std::uint64_t n)
{
    return candidate.parent_path() /
           fmt::format("{}_{}{}", candidate.stem().string(), n, candidate.extension().string());
}

struct allocated_output {
    std::filesystem::path path;
    output_file file;
    std::uint64_t collisions = 0;  // names skipped because they already existed
};

// Creates the split file for `seq`. If the name is taken, appends _1, _2, ...
// until an exclusive create succeeds. Existing files are never opened.
inline allocated_output open_split(const std::filesystem::path& input,
                                   const std::filesystem::path& output_dir,
                                   std::uint64_t seq)
{
    const std::filesystem::path candidate = split_path(input, output_dir, seq);
    std::filesystem::path p = candidate;
    for (std::uint64_t retry = 0;; ) {
        if (std::optional<output_file> f = output_file::create_exclusive(p))
            return allocated_output{p, std::move(*f), retry};
        fmt::print(stderr, "WARN: {} exists, trying another name\n", p.string());
        p = disambiguated_path(candidate, ++retry);
    }
}

}
