#pragma once
#include <CLI/CLI.hpp>
#include <cstdint>
#include <string>
#include <filesystem>

#include "../split/splitter.hpp"

struct AppOptions {
    // Required/paths
    std::string input;
    std::string output_dir;             // empty: beside the input
    std::string index_path;             // empty: no index

    // Splitting
    std::uint64_t num_per_split = csvsplit::default_num_per_split;

    // Perf
    std::size_t chunk_bytes = csvsplit::default_chunk_bytes;

    // Console
    bool quiet = false;
};

// Thrown once CLI11 has printed help, version or a usage error.
struct CliExit {
    int code = 0;
};

inline AppOptions parse_cli(int argc, char** argv) {
    AppOptions opt;
    CLI::App app{"Split a large Excel-style CSV file at record boundaries"};
    app.set_version_flag("-v,--version", "csvsplit 0.1.0");
    app.set_config("--config", "", "Read options from a TOML/INI file");

    app.add_option("input_csv", opt.input,
                   "Input file. Splits are written beside it as <name>_000001.<ext>, ... "
                   "unless --output-dir is given")
        ->required()
        ->check(CLI::ExistingFile);

    app.add_option("-n,--num_per_split,--num-per-split", opt.num_per_split,
                   "Records per split file")
        ->capture_default_str()
        ->check(CLI::PositiveNumber)
        ->envname("CSVSPLIT_NUM_PER_SPLIT");
    app.add_option("-o,--output-dir", opt.output_dir,
                   "Write split files here instead of next to the input")
        ->check(CLI::ExistingDirectory)
        ->envname("CSVSPLIT_OUTPUT_DIR");
    app.add_option("-x,--generate-index", opt.index_path,
                   "Write '<record>\\t<byte offset>' for every split boundary to this "
                   "new file (must not exist)");

    app.add_option("--chunk-bytes", opt.chunk_bytes, "Read block size (bytes)")
        ->capture_default_str()
        ->check(CLI::PositiveNumber)
        ->envname("CSVSPLIT_CHUNK_BYTES");
    app.add_flag("-q,--quiet", opt.quiet, "No progress output, summary only");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        throw CliExit{app.exit(e)};
    }
    return opt;
}

inline csvsplit::split_options to_split_options(const AppOptions& opt) {
    csvsplit::split_options s;
    s.input         = opt.input;
    s.output_dir    = opt.output_dir;
    s.index_path    = opt.index_path;
    s.num_per_split = opt.num_per_split;
    s.chunk_bytes   = opt.chunk_bytes;
    return s;
}
