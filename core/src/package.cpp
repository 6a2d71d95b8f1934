#include "gauntlet/package.h"
#include "gauntlet/types.h"

#include <algorithm>
#include <map>

namespace gauntlet {

namespace fs = std::filesystem;

size_t Package::n_tests() const {
    size_t n = 0;
    for (const auto& s : subpackages) n += s.tests.size();
    return n;
}

size_t Discovery::n_tests() const {
    size_t n = 0;
    for (const auto& p : packages) n += p.n_tests();
    return n;
}

bool is_test_file(const fs::path& p) {
    const std::string name = p.filename().string();
    if (name.empty() || name[0] == '.') return false;
    const std::string ext = p.extension().string();
    return ext != ".out" && ext != ".ins";
}

// Collect the test files of one directory (non-recursive) into a subpackage.
static Subpackage load_subpackage(const std::string& name,
                                  const fs::path& dir,
                                  const std::vector<fs::path>& files,
                                  const TestFileOptions& opts,
                                  std::vector<DiscoveryIssue>* issues) {
    Subpackage sp;
    sp.name = name;
    sp.path = dir;
    for (const auto& f : files) {
        auto tf = std::make_unique<TestFile>(f, opts);
        if (!tf->valid()) {
            for (const auto& e : tf->errors()) issues->push_back({f.string(), e.message});
            continue;
        }
        sp.tests.push_back(std::move(tf));
    }
    return sp;
}

static Package load_package(const std::string& name,
                            const fs::path& root,
                            bool recursive,
                            const TestFileOptions& opts,
                            std::vector<DiscoveryIssue>* issues) {
    Package pkg;
    pkg.name = name;
    pkg.path = root;

    // directory -> its test files, ordered by path
    std::map<fs::path, std::vector<fs::path>> by_dir;
    std::error_code ec;
    auto add = [&](const fs::directory_entry& e) {
        std::error_code fec;
        if (!e.is_regular_file(fec) || !is_test_file(e.path())) return;
        by_dir[e.path().parent_path()].push_back(e.path());
    };
    if (recursive) {
        for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
            const std::string fname = it->path().filename().string();
            std::error_code dec;
            if (!fname.empty() && fname[0] == '.' && it->is_directory(dec)) {
                it.disable_recursion_pending();
                continue;
            }
            add(*it);
        }
    } else {
        for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) add(*it);
    }

    for (auto& kv : by_dir) {
        std::sort(kv.second.begin(), kv.second.end());
        std::string sp_name = kv.first.lexically_relative(root).string();
        if (sp_name.empty()) sp_name = ".";
        Subpackage sp = load_subpackage(sp_name, kv.first, kv.second, opts, issues);
        if (!sp.tests.empty()) pkg.subpackages.push_back(std::move(sp));
    }
    return pkg;
}

Discovery gather_packages(const fs::path& test_dir,
                          const TestFileOptions& opts,
                          const std::string& only_package) {
    std::error_code ec;
    if (!fs::is_directory(test_dir, ec)) {
        throw ConfigError("test directory does not exist: " + test_dir.string());
    }

    Discovery d;
    std::vector<fs::path> pkg_dirs;
    bool root_has_tests = false;
    for (fs::directory_iterator it(test_dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code fec;
        const std::string name = it->path().filename().string();
        if (it->is_directory(fec)) {
            if (!name.empty() && name[0] != '.') pkg_dirs.push_back(it->path());
        } else if (it->is_regular_file(fec) && is_test_file(it->path())) {
            root_has_tests = true;
        }
    }
    std::sort(pkg_dirs.begin(), pkg_dirs.end());

    if (root_has_tests) {
        fs::path canon = fs::weakly_canonical(test_dir, ec);
        std::string name = (ec ? test_dir : canon).filename().string();
        if (name.empty()) name = "tests";
        if (only_package.empty() || only_package == name) {
            Package root_pkg = load_package(name, test_dir, false, opts, &d.issues);
            if (!root_pkg.subpackages.empty()) d.packages.push_back(std::move(root_pkg));
        }
    }

    for (const auto& dir : pkg_dirs) {
        const std::string name = dir.filename().string();
        if (!only_package.empty() && only_package != name) continue;
        Package pkg = load_package(name, dir, true, opts, &d.issues);
        if (!pkg.subpackages.empty()) d.packages.push_back(std::move(pkg));
    }
    return d;
}

} // namespace gauntlet
