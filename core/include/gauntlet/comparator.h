#pragma once

#include <cstddef>
#include <string>

namespace gauntlet {

struct Diff {
    bool equal{true};
    size_t first_diff_offset{0};  // valid when !equal
    size_t expected_size{0};
    size_t generated_size{0};
    std::string text;             // human-readable description, empty when equal
};

// Exact byte comparison. No whitespace or encoding normalization.
Diff compare_output(const std::string& generated, const std::string& expected);

// True when every byte is printable ASCII, tab, CR or LF.
bool looks_like_text(const std::string& s);

// Truncate for storage, appending a marker when bytes were dropped.
std::string trim_bytes(const std::string& data, size_t max_bytes = 512);

// Escape non-printable bytes ("\n", "\x00") for single-line display.
std::string escape_bytes(const std::string& data);

} // namespace gauntlet
