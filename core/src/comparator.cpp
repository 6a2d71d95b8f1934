#include "gauntlet/comparator.h"

#include <algorithm>
#include <cstdio>
#include <sstream>

namespace gauntlet {

bool looks_like_text(const std::string& s) {
    for (unsigned char c : s) {
        if (c == '\n' || c == '\r' || c == '\t') continue;
        if (c < 0x20 || c >= 0x7f) return false;
    }
    return true;
}

std::string escape_bytes(const std::string& data) {
    std::string out;
    out.reserve(data.size());
    for (unsigned char c : data) {
        switch (c) {
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\\': out += "\\\\"; break;
            default:
                if (c < 0x20 || c >= 0x7f) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\x%02x", (unsigned)c);
                    out += buf;
                } else {
                    out.push_back((char)c);
                }
                break;
        }
    }
    return out;
}

std::string trim_bytes(const std::string& data, size_t max_bytes) {
    if (data.size() <= max_bytes) return data;
    std::string out = data.substr(0, max_bytes);
    out += "\n... (output trimmed to " + std::to_string(max_bytes) + " bytes)";
    return out;
}

// 1-based line number and [begin, end) of the line holding offset.
static void line_at(const std::string& s, size_t offset, size_t* lineno, size_t* begin, size_t* end) {
    size_t n = 1;
    size_t b = 0;
    for (size_t i = 0; i < offset && i < s.size(); i++) {
        if (s[i] == '\n') {
            n++;
            b = i + 1;
        }
    }
    size_t e = s.find('\n', std::min(b, s.size()));
    if (e == std::string::npos) e = s.size();
    if (b > s.size()) b = s.size();
    *lineno = n;
    *begin = b;
    *end = e;
}

Diff compare_output(const std::string& generated, const std::string& expected) {
    Diff d;
    d.expected_size = expected.size();
    d.generated_size = generated.size();
    if (generated == expected) return d;

    d.equal = false;
    const size_t common = std::min(generated.size(), expected.size());
    size_t off = 0;
    while (off < common && generated[off] == expected[off]) off++;
    d.first_diff_offset = off;

    std::ostringstream oss;
    oss << "first difference at byte " << off
        << " (expected " << expected.size() << " bytes, generated " << generated.size() << " bytes)";

    if (looks_like_text(generated) && looks_like_text(expected)) {
        size_t ln = 0, eb = 0, ee = 0, gb = 0, ge = 0;
        line_at(expected, off, &ln, &eb, &ee);
        line_at(generated, off, &ln, &gb, &ge);
        oss << "\n  line " << ln << ":";
        if (off < expected.size() || eb < expected.size())
            oss << "\n  - " << escape_bytes(expected.substr(eb, ee - eb));
        else
            oss << "\n  - <end of expected output>";
        if (off < generated.size() || gb < generated.size())
            oss << "\n  + " << escape_bytes(generated.substr(gb, ge - gb));
        else
            oss << "\n  + <end of generated output>";
    } else {
        const size_t from = off >= 8 ? off - 8 : 0;
        auto hex = [from](const std::string& s) {
            std::ostringstream h;
            const size_t to = std::min(s.size(), from + 24);
            for (size_t i = from; i < to; i++) {
                char buf[4];
                std::snprintf(buf, sizeof(buf), "%02x", (unsigned)(unsigned char)s[i]);
                if (i > from) h << ' ';
                h << buf;
            }
            return h.str();
        };
        oss << "\n  - [" << from << "] " << hex(expected)
            << "\n  + [" << from << "] " << hex(generated);
    }
    d.text = oss.str();
    return d;
}

} // namespace gauntlet
