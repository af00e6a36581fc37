#pragma once
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

#include "../csv/boundary_scanner.hpp"
#include "../io/path_alloc.hpp"
#include "index_writer.hpp"

namespace csvsplit {

// Reported after a split file is closed and its successor opened.
struct rotation_event {
    std::uint64_t records = 0;            // records written so far
    std::uint64_t seq = 0;                // sequence number of the closed file
    std::filesystem::path closed;         // path of the closed file
};

// Routes the input bytes into split files, rotating to a new file after
// every num_per_split records. Exactly one split file is open at a time.
class split_writer {
public:
    using rotate_fn = std::function<void(const rotation_event&)>;

    split_writer(std::filesystem::path input,
                 std::filesystem::path output_dir,
                 std::uint64_t num_per_split,
                 index_writer* index = nullptr,
                 rotate_fn on_rotate = {})
        : input_(std::move(input)), output_dir_(std::move(output_dir)),
          num_per_split_(num_per_split), index_(index), on_rotate_(std::move(on_rotate))
    {
        if (num_per_split_ == 0) throw std::invalid_argument("num_per_split == 0");
    }

    // Opens split file #1.
    void start() {
        if (cur_) return;
        open_next();
    }

    // `chunk_start` is the input offset of chunk[0]; chunks must arrive in order.
    void consume(std::string_view chunk, std::uint64_t chunk_start) {
        if (!cur_) throw std::logic_error("split_writer::consume before start");
        std::size_t cut = 0;
        scanner_.for_each_boundary(chunk, [&](std::size_t i) {
            ++records_;
            if (records_ % num_per_split_ != 0) return;
            cur_->file.write(chunk.substr(cut, i + 1 - cut));
            cut = i + 1;
            if (index_) index_->add(records_, chunk_start + cut);
            rotate();
        });
        // Whatever is left of the chunk belongs to the current file.
        cur_->file.write(chunk.substr(cut));
        if (!chunk.empty()) {
            last_byte_ = chunk.back();
            bytes_in_ += chunk.size();
        }
    }

    // Counts a trailing record that has no LF and closes the last file.
    // Rotation only ever happens right after an LF, so "last byte is not LF"
    // also means the current file holds a non-empty tail.
    void finish() {
        if (bytes_in_ > 0 && last_byte_ != '\n') ++records_;
        if (cur_) cur_->file.close();
    }

    std::uint64_t records() const noexcept { return records_; }
    std::uint64_t files() const noexcept { return paths_.size(); }
    std::uint64_t bytes_in() const noexcept { return bytes_in_; }
    const std::vector<std::filesystem::path>& paths() const noexcept { return paths_; }
    const boundary_scanner& scanner() const noexcept { return scanner_; }

private:
    void open_next() {
        ++seq_;
        cur_.emplace(open_split(input_, output_dir_, seq_));
        paths_.push_back(cur_->path);
    }

    void rotate() {
        cur_->file.close();
        rotation_event ev{records_, seq_, cur_->path};
        open_next();
        if (on_rotate_) on_rotate_(ev);
    }

    std::filesystem::path input_;
    std::filesystem::path output_dir_;
    std::uint64_t num_per_split_;
    index_writer* index_;
    rotate_fn on_rotate_;

    boundary_scanner scanner_;
    std::optional<allocated_output> cur_;
    std::vector<std::filesystem::path> paths_;
    std::uint64_t seq_ = 0;
    std::uint64_t records_ = 0;
    std::uint64_t bytes_in_ = 0;
    char last_byte_ = '\0';
};

}
