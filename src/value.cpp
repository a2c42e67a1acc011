#include "gtx8cfg/value.hpp"

namespace gtx8cfg {

std::string to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::Io: return "Io";
        case ErrorKind::TruncatedInput: return "TruncatedInput";
        case ErrorKind::SchemaViolation: return "SchemaViolation";
        case ErrorKind::JsonParse: return "JsonParse";
        case ErrorKind::InvalidData: return "InvalidData";
        default: return "Unknown";
    }
}

CfgError::CfgError(ErrorKind k, const std::string& msg)
    : std::runtime_error(msg), kind_(k) {}

CfgError::CfgError(ErrorKind k, const std::string& msg, std::string field,
                   std::size_t required, std::size_t available)
    : std::runtime_error(msg),
      kind_(k),
      field_(std::move(field)),
      required_(required),
      available_(available) {}

ErrorKind CfgError::kind() const noexcept { return kind_; }
const std::string& CfgError::field() const noexcept { return field_; }
std::size_t CfgError::required() const noexcept { return required_; }
std::size_t CfgError::available() const noexcept { return available_; }

// ------------------------------
// Value helpers
// ------------------------------

Value Value::make_integer(Integer i) {
    Value v;
    v.v = i;
    return v;
}

Value Value::make_flag(bool b) {
    Value v;
    v.v = b;
    return v;
}

Value Value::make_bytes(Bytes b) {
    Value v;
    v.v = std::move(b);
    return v;
}

Value Value::make_object() {
    Value v;
    v.v = Object{};
    return v;
}

Value Value::make_object(Object o) {
    Value v;
    v.v = std::move(o);
    return v;
}

Value Value::make_array() {
    Value v;
    v.v = Array{};
    return v;
}

Value Value::make_array(Array a) {
    Value v;
    v.v = std::move(a);
    return v;
}

bool Value::is_integer() const noexcept { return std::holds_alternative<Integer>(v); }
bool Value::is_flag() const noexcept { return std::holds_alternative<bool>(v); }
bool Value::is_bytes() const noexcept { return std::holds_alternative<Bytes>(v); }
bool Value::is_object() const noexcept { return std::holds_alternative<Object>(v); }
bool Value::is_array() const noexcept { return std::holds_alternative<Array>(v); }

Value::Integer Value::as_integer() const {
    if (!is_integer()) throw CfgError(ErrorKind::InvalidData, "value is not an integer");
    return std::get<Integer>(v);
}

bool Value::as_flag() const {
    if (!is_flag()) throw CfgError(ErrorKind::InvalidData, "value is not a flag");
    return std::get<bool>(v);
}

const Value::Bytes& Value::as_bytes() const {
    if (!is_bytes()) throw CfgError(ErrorKind::InvalidData, "value is not a byte array");
    return std::get<Bytes>(v);
}

const Value::Object& Value::as_object() const {
    if (!is_object()) throw CfgError(ErrorKind::InvalidData, "value is not an object");
    return std::get<Object>(v);
}

Value::Object& Value::as_object() {
    if (!is_object()) throw CfgError(ErrorKind::InvalidData, "value is not an object");
    return std::get<Object>(v);
}

const Value::Array& Value::as_array() const {
    if (!is_array()) throw CfgError(ErrorKind::InvalidData, "value is not an array");
    return std::get<Array>(v);
}

Value::Array& Value::as_array() {
    if (!is_array()) throw CfgError(ErrorKind::InvalidData, "value is not an array");
    return std::get<Array>(v);
}

const Value* Value::find(const std::string& key) const {
    if (!is_object()) return nullptr;
    for (const auto& m : std::get<Object>(v)) {
        if (m.first == key) return &m.second;
    }
    return nullptr;
}

const Value& Value::at(const std::string& key) const {
    const Value* found = find(key);
    if (!found) throw CfgError(ErrorKind::InvalidData, "no member '" + key + "'");
    return *found;
}

const Value& Value::at(std::size_t index) const {
    const auto& a = as_array();
    if (index >= a.size()) {
        throw CfgError(ErrorKind::InvalidData, "array index " + std::to_string(index) + " out of range");
    }
    return a[index];
}

void Value::set(const std::string& key, Value val) {
    auto& o = as_object();
    for (auto& m : o) {
        if (m.first == key) {
            m.second = std::move(val);
            return;
        }
    }
    o.emplace_back(key, std::move(val));
}

std::size_t Value::size() const noexcept {
    if (auto* o = std::get_if<Object>(&v)) return o->size();
    if (auto* a = std::get_if<Array>(&v)) return a->size();
    if (auto* b = std::get_if<Bytes>(&v)) return b->size();
    return 0;
}

bool operator==(const Value& a, const Value& b) {
    return a.v == b.v;
}

bool operator!=(const Value& a, const Value& b) {
    return !(a == b);
}

const char* type_name(const Value& v) {
    if (v.is_integer()) return "int";
    if (v.is_flag()) return "flag";
    if (v.is_bytes()) return "bytes";
    if (v.is_object()) return "object";
    return "array";
}

} // namespace gtx8cfg
