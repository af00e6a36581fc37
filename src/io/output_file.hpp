#pragma once
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <string_view>
#include <utility>

#include "../util/errors.hpp"

namespace csvsplit {

// Writable binary file that is always freshly created: opening never touches
// an existing file. Flushed and closed exactly once, by close() or by the
// destructor on an error path.
class output_file {
public:
    // Atomically creates `p`. Returns nullopt if something already exists at
    // `p`; any other failure throws io_error.
    static std::optional<output_file> create_exclusive(const std::filesystem::path& p) {
        errno = 0;
        // "x" is the C11 exclusive-create flag (O_CREAT | O_EXCL).
        std::FILE* f = std::fopen(p.string().c_str(), "wbx");
        if (!f) {
            const int err = errno;
            if (err == EEXIST) return std::nullopt;
            throw io_error(describe_errno("failed to create", p, err));
        }
        return output_file(p, f);
    }

    output_file(output_file&& o) noexcept
        : path_(std::move(o.path_)), f_(std::exchange(o.f_, nullptr)), bytes_(o.bytes_) {}

    output_file& operator=(output_file&& o) noexcept {
        if (this != &o) {
            discard();
            path_  = std::move(o.path_);
            f_     = std::exchange(o.f_, nullptr);
            bytes_ = o.bytes_;
        }
        return *this;
    }

    output_file(const output_file&) = delete;
    output_file& operator=(const output_file&) = delete;

    ~output_file() { discard(); }

    void write(std::string_view bytes) {
        if (bytes.empty()) return;
        if (!f_) throw io_error("write to closed file: " + path_.string());
        if (std::fwrite(bytes.data(), 1, bytes.size(), f_) != bytes.size())
            throw io_error(describe_errno("write failed", path_, errno));
        bytes_ += bytes.size();
    }

    void flush() {
        if (f_ && std::fflush(f_) != 0)
            throw io_error(describe_errno("flush failed", path_, errno));
    }

    // Idempotent.
    void close() {
        if (!f_) return;
        std::FILE* f = std::exchange(f_, nullptr);
        const bool flushed = std::fflush(f) == 0;
        const int flush_err = errno;
        if (std::fclose(f) != 0 || !flushed)
            throw io_error(describe_errno("close failed", path_, flushed ? errno : flush_err));
    }

    bool is_open() const noexcept { return f_ != nullptr; }
    std::uint64_t bytes_written() const noexcept { return bytes_; }
    const std::filesystem::path& path() const noexcept { return path_; }

private:
    output_file(std::filesystem::path p, std::FILE* f) : path_(std::move(p)), f_(f) {}

    // fclose flushes; failures here have nowhere to go.
    void discard() noexcept {
        if (f_) std::fclose(std::exchange(f_, nullptr));
    }

    std::filesystem::path path_;
    std::FILE* f_ = nullptr;
    std::uint64_t bytes_ = 0;
};

}
