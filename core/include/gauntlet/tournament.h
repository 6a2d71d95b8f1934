#pragma once
#include "runner.h"
#include "types.h"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace gauntlet {

// Labeled table of text cells keyed by (row, column). Rows and columns are
// emitted sorted case-insensitively; an absent cell is written as "".
class ScoreMatrix {
public:
    void set(const std::string& row, const std::string& col, const std::string& text);

    // "" when the cell was never set
    std::string get(const std::string& row, const std::string& col) const;

    std::vector<std::string> rows() const;
    std::vector<std::string> columns() const;
    bool empty() const { return cells_.empty(); }

    // Header row starts with corner_label, then one line per row.
    std::string to_csv(const std::string& corner_label) const;
    bool write_csv(const std::filesystem::path& path, const std::string& corner_label,
                   std::string* err) const;

private:
    std::map<std::string, std::map<std::string, std::string>> cells_;
    std::vector<std::string> rows_;
    std::vector<std::string> cols_;
};

// "p / t"
std::string score_cell(const Counter& c);

// Sort a copy of names ignoring ASCII case (ties keep byte order).
std::vector<std::string> sorted_ci(std::vector<std::string> names);

// Quote a CSV field when it holds a comma, quote or newline.
std::string csv_field(const std::string& s);

// Human-readable block describing one failing test; every captured field is
// cut to max_bytes.
std::string format_feedback(const TestResult& r, const std::string& package,
                            size_t max_bytes = 512);

bool append_text(const std::filesystem::path& path, const std::string& text, std::string* err);

// "<toolchain> <package> <testpath>\n"
std::string failure_log_line(const std::string& toolchain, const std::string& package,
                             const std::string& test_path);

// <exe>-<toolchain>-feedback.txt
std::string feedback_file_name(const std::string& exe_id, const std::string& toolchain);

} // namespace gauntlet
