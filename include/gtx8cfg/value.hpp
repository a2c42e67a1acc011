#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace gtx8cfg {

// ------------------------------
// Error model
// ------------------------------

enum class ErrorKind {
    Io,
    TruncatedInput,
    SchemaViolation,
    JsonParse,
    InvalidData,
};

std::string to_string(ErrorKind k);

class CfgError : public std::runtime_error {
public:
    CfgError(ErrorKind k, const std::string& msg);
    CfgError(ErrorKind k, const std::string& msg, std::string field,
             std::size_t required = 0, std::size_t available = 0);

    ErrorKind kind() const noexcept;
    // Dotted path of the field that failed, e.g. "cfg_pkgs[1].reg_info.esd.addr".
    const std::string& field() const noexcept;
    // Byte counts for TruncatedInput; zero otherwise.
    std::size_t required() const noexcept;
    std::size_t available() const noexcept;

private:
    ErrorKind kind_;
    std::string field_;
    std::size_t required_{0};
    std::size_t available_{0};
};

// ------------------------------
// Decoded value tree
// ------------------------------

struct Value {
    using Integer = std::int64_t;
    using Bytes = std::vector<std::uint8_t>;
    using Member = std::pair<std::string, Value>;
    // Members keep insertion order, which is schema declaration order.
    using Object = std::vector<Member>;
    using Array = std::vector<Value>;

    std::variant<Integer, bool, Bytes, Object, Array> v;

    static Value make_integer(Integer i);
    static Value make_flag(bool b);
    static Value make_bytes(Bytes b);
    static Value make_object();
    static Value make_object(Object o);
    static Value make_array();
    static Value make_array(Array a);

    bool is_integer() const noexcept;
    bool is_flag() const noexcept;
    bool is_bytes() const noexcept;
    bool is_object() const noexcept;
    bool is_array() const noexcept;

    Integer as_integer() const;
    bool as_flag() const;
    const Bytes& as_bytes() const;
    const Object& as_object() const;
    Object& as_object();
    const Array& as_array() const;
    Array& as_array();

    /// Member lookup on an object; nullptr when absent or when this is not an object.
    const Value* find(const std::string& key) const;
    /// Member lookup that throws InvalidData when the key is missing.
    const Value& at(const std::string& key) const;
    const Value& at(std::size_t index) const;

    /// Append a member, or replace it in place when the key already exists.
    void set(const std::string& key, Value val);

    /// Number of members, elements or bytes; zero for scalars.
    std::size_t size() const noexcept;
};

bool operator==(const Value& a, const Value& b);
bool operator!=(const Value& a, const Value& b);

/// Short type label used by the tools ("int", "flag", "bytes", "object", "array").
const char* type_name(const Value& v);

} // namespace gtx8cfg
