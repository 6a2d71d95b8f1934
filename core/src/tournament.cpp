#include "gauntlet/tournament.h"
#include "gauntlet/comparator.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace gauntlet {

static std::string lower(const std::string& s) {
    std::string o = s;
    for (auto& c : o) c = (char)std::tolower((unsigned char)c);
    return o;
}

std::vector<std::string> sorted_ci(std::vector<std::string> names) {
    std::sort(names.begin(), names.end(), [](const std::string& a, const std::string& b) {
        std::string la = lower(a), lb = lower(b);
        if (la != lb) return la < lb;
        return a < b;
    });
    return names;
}

std::string csv_field(const std::string& s) {
    if (s.find_first_of(",\"\n\r") == std::string::npos) return s;
    std::string o = "\"";
    for (char c : s) {
        if (c == '"') o += "\"\"";
        else o.push_back(c);
    }
    o += "\"";
    return o;
}

std::string score_cell(const Counter& c) {
    return std::to_string(c.pass) + " / " + std::to_string(c.total);
}

void ScoreMatrix::set(const std::string& row, const std::string& col, const std::string& text) {
    if (std::find(rows_.begin(), rows_.end(), row) == rows_.end()) rows_.push_back(row);
    if (std::find(cols_.begin(), cols_.end(), col) == cols_.end()) cols_.push_back(col);
    cells_[row][col] = text;
}

std::string ScoreMatrix::get(const std::string& row, const std::string& col) const {
    auto r = cells_.find(row);
    if (r == cells_.end()) return "";
    auto c = r->second.find(col);
    return c == r->second.end() ? "" : c->second;
}

std::vector<std::string> ScoreMatrix::rows() const { return sorted_ci(rows_); }
std::vector<std::string> ScoreMatrix::columns() const { return sorted_ci(cols_); }

std::string ScoreMatrix::to_csv(const std::string& corner_label) const {
    const auto cols = columns();
    std::ostringstream out;
    out << csv_field(corner_label);
    for (const auto& c : cols) out << "," << csv_field(c);
    out << "\n";
    for (const auto& r : rows()) {
        out << csv_field(r);
        for (const auto& c : cols) out << "," << csv_field(get(r, c));
        out << "\n";
    }
    return out.str();
}

bool ScoreMatrix::write_csv(const std::filesystem::path& path, const std::string& corner_label,
                            std::string* err) const {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) {
        if (err) *err = "cannot open " + path.string();
        return false;
    }
    f << to_csv(corner_label);
    if (!f) {
        if (err) *err = "write failed: " + path.string();
        return false;
    }
    return true;
}

std::string format_feedback(const TestResult& r, const std::string& package, size_t max_bytes) {
    std::ostringstream o;
    o << "=== " << (r.test ? r.test->file() : std::string("?")) << " (" << package << ") ===\n";
    o << "Toolchain: " << r.toolchain << "\n";
    o << "Reason: " << fail_reason_name(r.reason) << "\n";
    o << "Failing step: " << (r.failing_step.empty() ? "-" : r.failing_step) << "\n";
    if (!r.error.empty()) o << "Error: " << trim_bytes(r.error, max_bytes) << "\n";
    o << "--- test contents ---\n" << trim_bytes(r.test ? r.test->contents() : "", max_bytes) << "\n";
    o << "--- expected output ---\n" << trim_bytes(r.test ? r.test->expected_out() : "", max_bytes) << "\n";
    o << "--- generated output ---\n" << trim_bytes(r.gen_output, max_bytes) << "\n";
    o << "\n";
    return o.str();
}

bool append_text(const std::filesystem::path& path, const std::string& text, std::string* err) {
    std::ofstream f(path, std::ios::binary | std::ios::app);
    if (!f) {
        if (err) *err = "cannot open " + path.string();
        return false;
    }
    f << text;
    if (!f) {
        if (err) *err = "write failed: " + path.string();
        return false;
    }
    return true;
}

std::string failure_log_line(const std::string& toolchain, const std::string& package,
                             const std::string& test_path) {
    return toolchain + " " + package + " " + test_path + "\n";
}

std::string feedback_file_name(const std::string& exe_id, const std::string& toolchain) {
    return exe_id + "-" + toolchain + "-feedback.txt";
}

} // namespace gauntlet
