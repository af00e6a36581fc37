#pragma once
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace csvsplit {

// Any failure to open, read, write or close a file.
class io_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A file we must create exclusively is already there.
class output_exists_error : public io_error {
public:
    explicit output_exists_error(const std::filesystem::path& p)
        : io_error("refusing to overwrite existing file: " + p.string()), path_(p) {}

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

// "<what>: <path> (<strerror(err)>)"
inline std::string describe_errno(const char* what, const std::filesystem::path& p, int err) {
    std::string msg = what;
    msg += ": ";
    msg += p.string();
    if (err != 0) {
        msg += " (";
        msg += std::strerror(err);
        msg += ")";
    }
    return msg;
}

}
