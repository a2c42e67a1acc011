#pragma once

#include "gtx8cfg/value.hpp"

#include <ostream>
#include <string>

namespace gtx8cfg {

struct JsonOptions {
    bool pretty{true};
    int indent{2};
};

/// Render a value tree as JSON. Objects keep member order; byte arrays render
/// as arrays of decimal integers.
void write_json(std::ostream& os, const Value& v, const JsonOptions& opts = JsonOptions{});
std::string to_json(const Value& v, const JsonOptions& opts = JsonOptions{});

/// Parse a JSON document back into a value tree. Arrays always come back as
/// arrays (JSON cannot tell byte arrays apart). Strings, null and non-integer
/// numbers are rejected with CfgError(JsonParse).
Value from_json(const std::string& text);

} // namespace gtx8cfg
