#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

// Quote-aware record boundary scanner for Excel-style CSV.
// - Fields may be wrapped in "..." and then contain commas, CR and LF.
// - A literal quote inside a quoted field is written as "".
// - Only LF terminates a record; in CRLF input the CR stays with the record.
// - Delimiters are irrelevant here: we only ever split between records.
//
// The scanner never looks ahead and keeps no buffer, so it can be fed one byte
// at a time across arbitrary chunk boundaries.

namespace csvsplit {

enum class quote_state : std::uint8_t {
    start,          // outside any quoted field
    in_quote,       // inside an open quoted field
    end_quote,      // saw " while in_quote: closes the field or starts ""
    literal_quote   // resolved "" pair; collapses back to in_quote at once
};

struct scan_step {
    quote_state state = quote_state::start;
    bool record_end = false;
};

// One transition. The checks run in a fixed priority order; a byte that
// follows a field-closing quote is re-evaluated from `start` in the same step.
constexpr scan_step scan_byte(quote_state s, unsigned char c) noexcept {
    if (s == quote_state::end_quote && c == '"') {
        s = quote_state::literal_quote;
    } else if (s == quote_state::end_quote) {
        s = quote_state::start;
    }

    if (s == quote_state::literal_quote) {
        return scan_step{quote_state::in_quote, false};
    }
    if (s == quote_state::in_quote) {
        return scan_step{c == '"' ? quote_state::end_quote : quote_state::in_quote, false};
    }
    if (c == '"') {
        return scan_step{quote_state::in_quote, false};
    }
    return scan_step{quote_state::start, c == '\n'};
}

class boundary_scanner {
public:
    // True when `c` terminates a record.
    bool feed(unsigned char c) noexcept {
        const scan_step step = scan_byte(state_, c);
        state_ = step.state;
        return step.record_end;
    }

    // Calls fn(i) for every record-terminating LF in `chunk`, i being the
    // chunk-relative index of that LF. Returns the number of terminators.
    template <class Fn>
    std::size_t for_each_boundary(std::string_view chunk, Fn&& fn) {
        std::size_t found = 0;
        for (std::size_t i = 0; i < chunk.size(); ++i) {
            if (feed(static_cast<unsigned char>(chunk[i]))) {
                ++found;
                fn(i);
            }
        }
        return found;
    }

    quote_state state() const noexcept { return state_; }

    // True while a quoted field is open. At end of input an end_quote state
    // means the last quote closed its field, so it does not count.
    bool in_field() const noexcept { return state_ == quote_state::in_quote; }

    void reset() noexcept { state_ = quote_state::start; }

private:
    quote_state state_ = quote_state::start;
};

inline const char* to_string(quote_state s) noexcept {
    switch (s) {
        case quote_state::start:         return "start";
        case quote_state::in_quote:      return "in_quote";
        case quote_state::end_quote:     return "end_quote";
        case quote_state::literal_quote: return "literal_quote";
    }
    return "?";
}

} // namespace csvsplit
