#pragma once
#include "types.h"

#include <json-c/json.h>

#include <fstream>
#include <string>

namespace gauntlet {

// Machine-readable run log: one canonical (sorted-key) JSON object per line.
class JsonlLogger {
public:
    JsonlLogger(const RunHeader& hdr, const std::string& path);

    bool ok() const { return static_cast<bool>(out_); }

    // Takes ownership of payload (may be nullptr).
    void event(const std::string& name, json_object* payload);

    const std::string& path() const { return path_; }

private:
    RunHeader hdr_;
    std::string path_;
    std::ofstream out_;
    long long seq_{0};
};

// Deterministic serialization with object keys sorted (JCS subset).
std::string canonical_json(json_object* obj);

} // namespace gauntlet
