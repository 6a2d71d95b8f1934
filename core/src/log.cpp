#include "gauntlet/log.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace gauntlet {

static std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

static void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) { out << "null"; return; }

    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());

        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            json_object* ks = json_object_new_string(keys[i].c_str());
            out << json_object_to_json_string_ext(ks, JSON_C_TO_STRING_PLAIN);
            json_object_put(ks);
            out << ":";
            json_object* val = nullptr;
            json_object_object_get_ex(obj, keys[i].c_str(), &val);
            canonical_serialize(val, out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        const size_t len = json_object_array_length(obj);
        for (size_t i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, i), out);
        }
        out << "]";
        break;
    }
    default:
        out << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
        break;
    }
}

std::string canonical_json(json_object* obj) {
    std::ostringstream out;
    canonical_serialize(obj, out);
    return out.str();
}

JsonlLogger::JsonlLogger(const RunHeader& hdr, const std::string& path)
    : hdr_(hdr), path_(path), out_(path, std::ios::out | std::ios::trunc) {}

void JsonlLogger::event(const std::string& name, json_object* payload) {
    json_object* line = json_object_new_object();
    json_object_object_add(line, "event", json_object_new_string(name.c_str()));
    json_object_object_add(line, "payload", payload ? payload : json_object_new_object());
    json_object_object_add(line, "mode", json_object_new_string(hdr_.mode.c_str()));
    json_object_object_add(line, "run_id", json_object_new_string(hdr_.run_id.c_str()));
    json_object_object_add(line, "format_version", json_object_new_string(hdr_.format_version.c_str()));
    json_object_object_add(line, "seq", json_object_new_int64(seq_++));
    json_object_object_add(line, "ts", json_object_new_string(iso_now().c_str()));

    if (out_) {
        out_ << canonical_json(line) << "\n";
        out_.flush();
    }
    json_object_put(line);
}

} // namespace gauntlet
