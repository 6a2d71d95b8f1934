#include "gauntlet/testfile.h"

#include <fstream>
#include <sstream>
#include <utility>

namespace gauntlet {

namespace fs = std::filesystem;

std::optional<std::string> read_file_bytes(const fs::path& p) {
    std::error_code ec;
    if (!fs::is_regular_file(p, ec)) return std::nullopt;
    std::ifstream f(p, std::ios::binary);
    if (!f) return std::nullopt;
    std::ostringstream oss;
    oss << f.rdbuf();
    return oss.str();
}

TestFile::TestFile(const fs::path& path, TestFileOptions opts)
    : path_(path.string()),
      stem_(path.stem().string()),
      extension_(path.extension().string()),
      opts_(std::move(opts)) {
    ResolveResult out = resolve_expected_out();
    if (auto* e = std::get_if<TestFileError>(&out)) errors_.push_back(*e);
    else expected_out_ = std::get<std::string>(std::move(out));

    ResolveResult ins = resolve_input_stream();
    if (auto* e = std::get_if<TestFileError>(&ins)) errors_.push_back(*e);
    else input_stream_ = std::get<std::string>(std::move(ins));
}

std::string TestFile::contents() const {
    return read_file_bytes(path_).value_or("");
}

ResolveResult TestFile::resolve_expected_out() const {
    return resolve(".out", opts_.output_dir, "CHECK:", "CHECK_FILE:");
}

ResolveResult TestFile::resolve_input_stream() const {
    return resolve(".ins", opts_.input_stream_dir, "INPUT:", "INPUT_FILE:");
}

ResolveResult TestFile::resolve(const std::string& suffix,
                                const std::string& mirror_dir,
                                const std::string& directive,
                                const std::string& file_directive) const {
    if (auto bytes = sibling_contents(suffix, mirror_dir)) {
        return std::move(*bytes);
    }
    if (auto bytes = directive_contents(directive)) {
        return std::move(*bytes);
    }
    if (auto ref = directive_contents(file_directive)) {
        fs::path ref_path = fs::path(path_).parent_path() / *ref;
        std::error_code ec;
        if (!fs::exists(ref_path, ec)) {
            return TestFileError{"Failed to locate path supplied to " + file_directive + " " +
                                 ref_path.string()};
        }
        auto bytes = read_file_bytes(ref_path);
        if (!bytes) {
            return TestFileError{"Failed to read path supplied to " + file_directive + " " +
                                 ref_path.string()};
        }
        return std::move(*bytes);
    }
    return std::string();
}

std::optional<std::string> TestFile::sibling_contents(const std::string& suffix,
                                                      const std::string& mirror_dir) const {
    fs::path p(path_);
    const std::string sibling_name = stem_ + suffix;

    // tests/input/a/b.c -> tests/output/a/b.out (last matching component only)
    fs::path parent = p.parent_path();
    std::vector<std::string> parts;
    for (const auto& comp : parent) parts.push_back(comp.string());
    for (size_t i = parts.size(); i-- > 0;) {
        if (parts[i] != opts_.input_dir) continue;
        parts[i] = mirror_dir;
        fs::path mirrored;
        for (const auto& s : parts) mirrored /= s;
        if (auto bytes = read_file_bytes(mirrored / sibling_name)) return bytes;
        break;
    }

    return read_file_bytes(parent / sibling_name);
}

std::optional<std::string> TestFile::directive_contents(const std::string& directive) const {
    std::ifstream f(path_, std::ios::binary);
    if (!f) return std::nullopt;

    std::optional<std::string> contents;
    std::string line;
    while (std::getline(f, line)) {
        size_t comment_idx = line.find(opts_.comment_syntax);
        size_t directive_idx = line.find(directive);
        if (comment_idx == std::string::npos || directive_idx == std::string::npos ||
            comment_idx > directive_idx) {
            continue;
        }
        std::string rhs = line.substr(directive_idx + directive.size());
        if (!rhs.empty() && rhs.back() == '\r') rhs.pop_back();

        if (!contents) contents = std::move(rhs);
        else *contents += "\n" + rhs;
    }
    return contents;
}

} // namespace gauntlet
