#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <iostream>
#include <string>

#include <sys/stat.h>
#include <unistd.h>

inline void die(const std::string& msg) {
    std::cerr << "TEST FAIL: " << msg << std::endl;
    std::exit(1);
}

inline void expect_true(bool cond, const std::string& msg) {
    if (!cond) die(msg);
}

inline void expect_eq_ll(long long a, long long b, const std::string& msg) {
    if (a != b) {
        die(msg + " (got=" + std::to_string(a) + ", want=" + std::to_string(b) + ")");
    }
}

inline void expect_eq_str(const std::string& a, const std::string& b, const std::string& msg) {
    if (a != b) {
        die(msg + " (got=\"" + a + "\", want=\"" + b + "\")");
    }
}

// Fresh per-process directory under the system temp dir; removed on scope exit.
struct TempDir {
    std::filesystem::path path;

    explicit TempDir(const std::string& name) {
        path = std::filesystem::temp_directory_path() /
               (name + "_" + std::to_string((long long)getpid()));
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
        std::filesystem::create_directories(path, ec);
        if (ec) die("cannot create temp dir " + path.string());
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
};

inline void write_file(const std::filesystem::path& p, const std::string& data) {
    std::error_code ec;
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path(), ec);
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    if (!f) die("cannot write " + p.string());
    f << data;
}

// Executable /bin/sh script for driving the runner with real child processes.
inline void write_script(const std::filesystem::path& p, const std::string& body) {
    write_file(p, "#!/bin/sh\n" + body);
    if (::chmod(p.c_str(), 0755) != 0) die("chmod failed for " + p.string());
}

inline std::string read_text(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}
