#pragma once

// json_mini.h
//
// Thin RAII + typed-lookup layer over json-c for configuration loading and
// event records. Lookups take a key path used in error messages
// ("toolchains.gcc[1].command").

#include <json-c/json.h>

#include <algorithm>
#include <climits>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "types.h"

namespace gauntlet::json_mini {

struct Doc {
    json_object* root{nullptr};

    Doc() = default;
    explicit Doc(json_object* r) : root(r) {}
    Doc(const Doc&) = delete;
    Doc& operator=(const Doc&) = delete;

    Doc(Doc&& other) noexcept : root(other.root) { other.root = nullptr; }
    Doc& operator=(Doc&& other) noexcept {
        if (this != &other) {
            if (root) json_object_put(root);
            root = other.root;
            other.root = nullptr;
        }
        return *this;
    }

    ~Doc() {
        if (root) json_object_put(root);
    }

    explicit operator bool() const { return root != nullptr; }
};

// Parse a complete JSON text. On failure returns an empty Doc and, when err
// is given, the tokener's description of the problem.
inline Doc parse(const std::string& json, std::string* err = nullptr) {
    json_tokener* tok = json_tokener_new();
    if (!tok) {
        if (err) *err = "out of memory";
        return Doc{};
    }
    json_object* obj = json_tokener_parse_ex(tok, json.c_str(),
        static_cast<int>(std::min(json.size(), static_cast<size_t>(INT_MAX))));
    json_tokener_error jerr = json_tokener_get_error(tok);
    json_tokener_free(tok);
    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        if (err) *err = json_tokener_error_desc(jerr);
        return Doc{};
    }
    return Doc{obj};
}

inline json_object* member(json_object* obj, const char* key) {
    if (!obj || !json_object_is_type(obj, json_type_object)) return nullptr;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(obj, key, &v)) return nullptr;
    return v;
}

inline json_object* require_member(json_object* obj, const char* key, const std::string& where) {
    json_object* v = member(obj, key);
    if (!v) throw ConfigError("missing required field: " + where + key);
    return v;
}

inline std::string as_string(json_object* v, const std::string& where) {
    if (!v || !json_object_is_type(v, json_type_string)) {
        throw ConfigError("expected string at " + where);
    }
    return std::string(json_object_get_string(v), (size_t)json_object_get_string_len(v));
}

inline bool as_bool(json_object* v, const std::string& where) {
    if (!v || !json_object_is_type(v, json_type_boolean)) {
        throw ConfigError("expected boolean at " + where);
    }
    return json_object_get_boolean(v) != 0;
}

inline int64_t as_int(json_object* v, const std::string& where) {
    if (!v || !json_object_is_type(v, json_type_int)) {
        throw ConfigError("expected integer at " + where);
    }
    return static_cast<int64_t>(json_object_get_int64(v));
}

inline std::vector<std::string> as_string_array(json_object* v, const std::string& where) {
    if (!v || !json_object_is_type(v, json_type_array)) {
        throw ConfigError("expected array of strings at " + where);
    }
    std::vector<std::string> out;
    const size_t n = json_object_array_length(v);
    out.reserve(n);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(v, i);
        out.push_back(as_string(el, where + "[" + std::to_string(i) + "]"));
    }
    return out;
}

inline std::optional<std::string> opt_string(json_object* obj, const char* key, const std::string& where) {
    json_object* v = member(obj, key);
    if (!v) return std::nullopt;
    return as_string(v, where + key);
}

inline std::optional<bool> opt_bool(json_object* obj, const char* key, const std::string& where) {
    json_object* v = member(obj, key);
    if (!v) return std::nullopt;
    return as_bool(v, where + key);
}

inline std::optional<int64_t> opt_int(json_object* obj, const char* key, const std::string& where) {
    json_object* v = member(obj, key);
    if (!v) return std::nullopt;
    return as_int(v, where + key);
}

} // namespace gauntlet::json_mini
