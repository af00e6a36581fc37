#include <fmt/format.h>
#include <cstdio>
#include <exception>

#include "../cli/cli_options.hpp"
#include "../metrics/timers.hpp"
#include "../split/splitter.hpp"

int main(int argc, char** argv) try {
    const AppOptions opt = parse_cli(argc, argv);
    const csvsplit::split_options sopt = to_split_options(opt);

    WallTimer wt; wt.start();

    if (!opt.quiet) {
        fmt::print("Reading... ");
        std::fflush(stdout);
    }
    auto progress = [&](const csvsplit::rotation_event&) {
        if (opt.quiet) return;
        fmt::print(".");
        std::fflush(stdout);
    };

    const csvsplit::split_result res = csvsplit::run_split(sopt, progress);
    wt.stop();

    if (!opt.quiet) fmt::print("\n");
    fmt::print("Processed {} records into {} files\n", res.records, res.files);
    if (!opt.quiet) {
        fmt::print("{} bytes in {:.3f} s ({:.2f} MB/s)\n",
                   res.bytes_in, wt.secs(), wt.mb_per_sec(res.bytes_in));
        if (!sopt.index_path.empty() && res.files > 0)
            fmt::print("Index: {} entries in {}\n", res.index_entries, sopt.index_path.string());
    }
    return 0;
}
catch (const CliExit& e) {
    return e.code == 0 ? 0 : 1; // usage/help/version already printed by CLI11
}
catch (const csvsplit::output_exists_error& e) {
    fmt::print(stderr, "\nERROR: {}\n", e.what());
    return 3;
}
catch (const csvsplit::io_error& e) {
    fmt::print(stderr, "\nERROR: {}\n", e.what());
    return 2; // IO error
}
catch (const std::exception& e) {
    fmt::print(stderr, "\nERROR: {}\n", e.what());
    return 4; // internal error
}
