#pragma once
#include <cstdint>
#include <filesystem>
#include <string_view>

#include "../io/chunk_reader.hpp"
#include "boundary_scanner.hpp"

// Streaming record count with the same rules the splitter uses:
// - a record ends at an LF outside quotes;
// - a non-empty tail that does not end in LF is one more record.
// Nothing is materialized; memory is one chunk.

namespace csvsplit {

struct record_counts {
    std::uint64_t records = 0;
    std::uint64_t bytes = 0;
    bool ends_in_field = false;   // input stopped inside an open quoted field
};

inline record_counts count_records(std::string_view data) {
    boundary_scanner sc;
    record_counts out;
    out.records = sc.for_each_boundary(data, [](std::size_t) {});
    out.bytes = data.size();
    if (!data.empty() && data.back() != '\n') ++out.records;
    out.ends_in_field = sc.in_field();
    return out;
}

inline record_counts count_records(const std::filesystem::path& path,
                                   std::size_t chunk_bytes = default_chunk_bytes)
{
    chunk_reader in(path, chunk_bytes);
    boundary_scanner sc;
    record_counts out;
    char last = '\0';
    for (std::string_view chunk = in.next(); !chunk.empty(); chunk = in.next()) {
        out.records += sc.for_each_boundary(chunk, [](std::size_t) {});
        last = chunk.back();
    }
    out.bytes = in.offset();
    if (out.bytes > 0 && last != '\n') ++out.records;
    out.ends_in_field = sc.in_field();
    return out;
}

}
