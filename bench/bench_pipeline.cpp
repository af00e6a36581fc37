#include "metrics/timers.hpp"
#include "csv/csv_count.hpp"
#include "split/splitter.hpp"
#include <fmt/format.h>
#include <cstdint>
#include <string>
#include <string_view>
#include <filesystem>
#include <system_error>

using std::string;
namespace fs = std::filesystem;

int main(int argc, char** argv){
  // Defaults
  string dataPath;
  string splitDir;                   // empty: scan only, no split files
  size_t chunkBytes = csvsplit::default_chunk_bytes;
  std::uint64_t perSplit = csvsplit::default_num_per_split;

  // Supported:
  //   --data <file>           | --data=<file>
  //   --chunk-bytes <N>       | --chunk-bytes=<N>
  //   --split-dir <dir>       also time a full split into <dir>
  //   --num-per-split <N>
  // Fallback positional: <input.csv> [chunk_bytes]
  for (int i=1;i<argc;++i){
    std::string_view a(argv[i]);

    auto eat_next = [&](std::string_view name, string* out)->bool{
      if (i+1<argc){ *out = argv[++i]; return true; }
      fmt::print(stderr, "missing value for {}\n", name);
      return false;
    };

    string v;
    if (a.rfind("--data=",0)==0) {
      dataPath = string(a.substr(7));
    } else if (a == "--data") {
      if (!eat_next(a, &dataPath)) return 2;
    } else if (a.rfind("--chunk-bytes=",0)==0) {
      chunkBytes = static_cast<size_t>(std::stoull(string(a.substr(14))));
    } else if (a == "--chunk-bytes") {
      if (!eat_next(a, &v)) return 2;
      chunkBytes = static_cast<size_t>(std::stoull(v));
    } else if (a == "--split-dir") {
      if (!eat_next(a, &splitDir)) return 2;
    } else if (a == "--num-per-split") {
      if (!eat_next(a, &v)) return 2;
      perSplit = std::stoull(v);
    } else if (dataPath.empty() && !a.empty() && a[0] != '-') {
      dataPath = string(a);
      if (i+1<argc && argv[i+1][0] != '-') {
        ++i;
        chunkBytes = static_cast<size_t>(std::stoull(argv[i]));
      }
    } else {
      fmt::print(stderr, "ignoring unknown argument {}\n", a);
    }
  }

  if (dataPath.empty() || chunkBytes == 0 || perSplit == 0){
    fmt::print(stderr,
      "usage:\n"
      "  csvsplit_bench_pipeline <input.csv> [chunk_bytes]\n"
      "  csvsplit_bench_pipeline --data <input.csv> [--chunk-bytes N]\n"
      "                          [--split-dir <dir> [--num-per-split N]]\n");
    return 2;
  }

  try {
    WallTimer wt; wt.start();
    const auto res = csvsplit::count_records(fs::path(dataPath), chunkBytes);
    wt.stop();

    const double rps = wt.secs()>0? (double(res.records)/wt.secs()) : 0.0;
    fmt::print("bench_scan,file={},records={},bytes={},sec={:.3f},MB/s={:.2f},records/s={:.0f}{}\n",
               dataPath, res.records, res.bytes, wt.secs(), wt.mb_per_sec(res.bytes), rps,
               res.ends_in_field ? ",unterminated_quote=1" : "");

    if (!splitDir.empty()){
      std::error_code ec;
      fs::create_directories(splitDir, ec);
      if (ec){ fmt::print(stderr, "cannot create {}: {}\n", splitDir, ec.message()); return 2; }

      csvsplit::split_options opt;
      opt.input = dataPath;
      opt.output_dir = splitDir;
      opt.num_per_split = perSplit;
      opt.chunk_bytes = chunkBytes;

      WallTimer ws; ws.start();
      const auto sres = csvsplit::run_split(opt);
      ws.stop();
      fmt::print("bench_split,file={},records={},files={},sec={:.3f},MB/s={:.2f}\n",
                 dataPath, sres.records, sres.files, ws.secs(), ws.mb_per_sec(sres.bytes_in));
      if (sres.records != res.records){
        fmt::print(stderr, "record count mismatch: scan={} split={}\n", res.records, sres.records);
        return 1;
      }
    }
  } catch (const std::exception& e) {
    fmt::print(stderr, "ERROR: {}\n", e.what());
    return 2;
  }
  return 0;
}
