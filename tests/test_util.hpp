#pragma once
#include <catch2/catch.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

// Fresh directory under the system temp dir, removed on destruction.
class scratch_dir {
public:
    explicit scratch_dir(const std::string& tag) {
        static std::atomic<unsigned> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = fs::temp_directory_path() /
                ("csvsplit_" + tag + "_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        fs::create_directories(path_);
    }
    ~scratch_dir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    scratch_dir(const scratch_dir&) = delete;
    scratch_dir& operator=(const scratch_dir&) = delete;

    const fs::path& path() const { return path_; }
    fs::path operator/(const std::string& name) const { return path_ / name; }

private:
    fs::path path_;
};

inline void write_file(const fs::path& p, const std::string& bytes) {
    std::ofstream f(p, std::ios::binary);
    REQUIRE(f);
    f << bytes;
}

inline std::string read_file(const fs::path& p) {
    std::ifstream f(p, std::ios::binary);
    REQUIRE(f);
    std::ostringstream oss;
    oss << f.rdbuf();
    return oss.str();
}

inline std::string concat_files(const std::vector<fs::path>& paths) {
    std::string all;
    for (const auto& p : paths) all += read_file(p);
    return all;
}

inline std::size_t count_entries(const fs::path& dir) {
    std::size_t n = 0;
    for (auto it = fs::directory_iterator(dir); it != fs::directory_iterator(); ++it) ++n;
    return n;
}

// Excel-style sample: quoted commas, "" escapes, embedded LF and CRLF,
// a record terminated by CRLF and one with an empty field.
inline std::string tricky_csv(int records) {
    std::string s;
    for (int i = 1; i <= records; ++i) {
        s += std::to_string(i);
        switch (i % 5) {
            case 0: s += ",\"multi\nline\r\nvalue\"\n"; break;
            case 1: s += ",\"say \"\"hi\"\", ok\"\n";   break;
            case 2: s += ",plain,\r\n";                   break;
            case 3: s += ",\"\"\"\"\n";                   break;
            default: s += ",\"a,b\",,\"\n\"\n";           break;
        }
    }
    return s;
}
