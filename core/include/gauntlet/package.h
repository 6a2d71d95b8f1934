#pragma once
#include "testfile.h"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace gauntlet {

// A directory that directly holds test files.
struct Subpackage {
    std::string name;       // path relative to the package root ("." for the root)
    std::filesystem::path path;
    // unique_ptr keeps TestFile addresses stable for TestResult::test
    std::vector<std::unique_ptr<TestFile>> tests;
};

// Top-level directory under the test root; attacking unit in tournaments.
struct Package {
    std::string name;
    std::filesystem::path path;
    std::vector<Subpackage> subpackages;

    size_t n_tests() const;
};

struct DiscoveryIssue {
    std::string path;
    std::string message;
};

struct Discovery {
    std::vector<Package> packages;
    std::vector<DiscoveryIssue> issues;  // fixtures dropped for load errors

    size_t n_tests() const;
};

// True for files that are test fixtures (not .out/.ins, not hidden).
bool is_test_file(const std::filesystem::path& p);

// Walk test_dir into packages/subpackages. Throws ConfigError if test_dir is
// not a directory. Invalid fixtures are removed and listed in issues. When
// only_package is non-empty, other packages are skipped.
Discovery gather_packages(const std::filesystem::path& test_dir,
                          const TestFileOptions& opts = {},
                          const std::string& only_package = "");

} // namespace gauntlet
