#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace gauntlet {

struct TestFileError {
    std::string message;
};

// Either the resolved bytes or the reason they could not be resolved.
using ResolveResult = std::variant<std::string, TestFileError>;

struct TestFileOptions {
    std::string input_dir{"input"};                // fixture tree component ...
    std::string output_dir{"output"};              // ... mirrored for .out files
    std::string input_stream_dir{"input-stream"};  // ... mirrored for .ins files
    std::string comment_syntax{"//"};
};

// A fixture on disk. Expected output and input stream are resolved once, at
// construction, each from the first source that is present:
//   1. sibling file (<stem>.out / <stem>.ins, mirrored directory first)
//   2. in-file directives (CHECK: / INPUT:), joined with '\n'
//   3. in-file file reference (CHECK_FILE: / INPUT_FILE:), relative to the test
//   4. empty
// A present source short-circuits even when its content is empty. A file
// reference that does not exist makes the fixture invalid.
class TestFile {
public:
    explicit TestFile(const std::filesystem::path& path, TestFileOptions opts = {});

    const std::string& path() const { return path_; }
    const std::string& stem() const { return stem_; }
    const std::string& extension() const { return extension_; }
    std::string file() const { return stem_ + extension_; }

    const std::string& expected_out() const { return expected_out_; }
    const std::string& input_stream() const { return input_stream_; }

    bool valid() const { return errors_.empty(); }
    const std::vector<TestFileError>& errors() const { return errors_; }

    // Current file contents (for feedback reports); "" if unreadable.
    std::string contents() const;

    ResolveResult resolve_expected_out() const;
    ResolveResult resolve_input_stream() const;

private:
    std::string path_;
    std::string stem_;
    std::string extension_;
    TestFileOptions opts_;

    std::string expected_out_;
    std::string input_stream_;
    std::vector<TestFileError> errors_;

    ResolveResult resolve(const std::string& suffix,
                          const std::string& mirror_dir,
                          const std::string& directive,
                          const std::string& file_directive) const;
    std::optional<std::string> sibling_contents(const std::string& suffix,
                                                const std::string& mirror_dir) const;
    std::optional<std::string> directive_contents(const std::string& directive) const;
};

// Whole-file binary read; nullopt if the file cannot be opened.
std::optional<std::string> read_file_bytes(const std::filesystem::path& p);

} // namespace gauntlet
