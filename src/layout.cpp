#include "gtx8cfg/layout.hpp"

#include <limits>
#include <sstream>

namespace gtx8cfg {

// ------------------------------
// Descriptor builders
// ------------------------------

static FieldDesc integer_field(const char* name, FieldKind kind, std::size_t width) {
    FieldDesc f;
    f.name = name;
    f.kind = kind;
    f.width = width;
    return f;
}

FieldDesc u8(const char* name) { return integer_field(name, FieldKind::UInt, 1); }
FieldDesc u16(const char* name) { return integer_field(name, FieldKind::UInt, 2); }
FieldDesc u32(const char* name) { return integer_field(name, FieldKind::UInt, 4); }
FieldDesc i8(const char* name) { return integer_field(name, FieldKind::Int, 1); }
FieldDesc i16(const char* name) { return integer_field(name, FieldKind::Int, 2); }
FieldDesc i32(const char* name) { return integer_field(name, FieldKind::Int, 4); }

FieldDesc bytes(const char* name, std::size_t len) {
    FieldDesc f;
    f.name = name;
    f.kind = FieldKind::Bytes;
    f.width = len;
    return f;
}

FieldDesc bitfield(const char* name, std::size_t width, std::initializer_list<BitRange> bits) {
    FieldDesc f;
    f.name = name;
    f.kind = FieldKind::Bitfield;
    f.width = width;
    f.bits.assign(bits.begin(), bits.end());
    return f;
}

FieldDesc record(const char* name, const Schema& sub) {
    FieldDesc f;
    f.name = name;
    f.kind = FieldKind::Record;
    f.sub = &sub;
    return f;
}

FieldDesc repeat(const char* name, const char* count_field, FieldDesc element) {
    FieldDesc f;
    f.name = name;
    f.kind = FieldKind::Repeat;
    f.count_field = count_field;
    f.element.push_back(std::move(element));
    return f;
}

FieldDesc reserved(const char* name, std::size_t len, bool must_be_zero) {
    FieldDesc f;
    f.name = name;
    f.kind = FieldKind::Reserved;
    f.width = len;
    f.must_be_zero = must_be_zero;
    return f;
}

std::size_t min_size(const FieldDesc& f) {
    switch (f.kind) {
        case FieldKind::Record: return f.sub ? min_size(*f.sub) : 0;
        case FieldKind::Repeat: return 0;
        default: return f.width;
    }
}

std::size_t min_size(const Schema& s) {
    std::size_t n = 0;
    for (const auto& f : s.fields) n += min_size(f);
    return n;
}

// ------------------------------
// Little-endian assembly
// ------------------------------

std::uint64_t read_uint_le(const std::uint8_t* p, std::size_t width) {
    std::uint64_t v = 0;
    for (std::size_t i = 0; i < width && i < 8; ++i) {
        v |= static_cast<std::uint64_t>(p[i]) << (8 * i);
    }
    return v;
}

std::int64_t read_int_le(const std::uint8_t* p, std::size_t width) {
    std::uint64_t u = read_uint_le(p, width);
    if (width > 0 && width < 8) {
        const std::uint64_t sign = std::uint64_t{1} << (8 * width - 1);
        if (u & sign) u |= ~((sign << 1) - 1);
    }
    return static_cast<std::int64_t>(u);
}

std::uint64_t extract_bits(std::uint64_t word, unsigned shift, unsigned width) {
    if (width == 0 || shift >= 64) return 0;
    std::uint64_t v = word >> shift;
    if (width >= 64) return v;
    return v & ((std::uint64_t{1} << width) - 1);
}

// ------------------------------
// Field walker
// ------------------------------

static std::string join(const std::string& path, const char* name) {
    if (path.empty()) return name;
    return path + "." + name;
}

static std::string indexed(const std::string& path, std::size_t i) {
    return path + "[" + std::to_string(i) + "]";
}

static void check_integer_width(const FieldDesc& f, const std::string& where) {
    if (f.width != 1 && f.width != 2 && f.width != 4) {
        throw CfgError(ErrorKind::InvalidData,
                       "schema error: integer field '" + where + "' has width " + std::to_string(f.width),
                       where);
    }
}

// Walks the fixed part of a schema to find the first field that does not fit
// into `avail` bytes. Returns its dotted path.
static std::string locate_truncation(const Schema& s, std::size_t avail, const std::string& path) {
    std::size_t pos = 0;
    for (const auto& f : s.fields) {
        const std::size_t need = min_size(f);
        if (pos + need > avail) {
            if (f.kind == FieldKind::Record && f.sub) {
                return locate_truncation(*f.sub, avail - pos, join(path, f.name));
            }
            return join(path, f.name);
        }
        pos += need;
    }
    return path;
}

[[noreturn]] static void throw_truncated(const std::string& field, std::size_t required, std::size_t available) {
    std::ostringstream oss;
    oss << "truncated input at '" << field << "': need " << required
        << " bytes, have " << available << " (" << (required - available) << " missing)";
    throw CfgError(ErrorKind::TruncatedInput, oss.str(), field, required, available);
}

class Walker {
public:
    Walker(const std::uint8_t* data, std::size_t size) : data_(data), size_(size) {}

    std::size_t cursor() const { return pos_; }

    Value record(const Schema& s, const std::string& path) {
        const std::size_t remaining = size_ - pos_;
        const std::size_t need = min_size(s);
        if (remaining < need) {
            const std::string field = locate_truncation(s, remaining, path);
            throw_truncated(field, need, remaining);
        }

        Value obj = Value::make_object();
        for (const auto& f : s.fields) {
            const std::string where = join(path, f.name);
            if (f.kind == FieldKind::Reserved) {
                skip_reserved(f, where);
                continue;
            }
            if (f.kind == FieldKind::Repeat) {
                obj.set(f.name, repeated(f, obj, where));
                continue;
            }
            obj.set(f.name, field(f, where));
        }
        return obj;
    }

private:
    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t pos_{0};

    const std::uint8_t* take(std::size_t n, const std::string& where) {
        const std::size_t remaining = size_ - pos_;
        if (n > remaining) throw_truncated(where, n, remaining);
        const std::uint8_t* p = data_ + pos_;
        pos_ += n;
        return p;
    }

    Value field(const FieldDesc& f, const std::string& where) {
        switch (f.kind) {
            case FieldKind::UInt: {
                check_integer_width(f, where);
                const std::uint8_t* p = take(f.width, where);
                return Value::make_integer(static_cast<Value::Integer>(read_uint_le(p, f.width)));
            }
            case FieldKind::Int: {
                check_integer_width(f, where);
                const std::uint8_t* p = take(f.width, where);
                return Value::make_integer(read_int_le(p, f.width));
            }
            case FieldKind::Bytes: {
                const std::uint8_t* p = take(f.width, where);
                return Value::make_bytes(Value::Bytes(p, p + f.width));
            }
            case FieldKind::Bitfield:
                return bits(f, where);
            case FieldKind::Record: {
                if (!f.sub) throw CfgError(ErrorKind::InvalidData, "schema error: record '" + where + "' has no sub-schema", where);
                return record(*f.sub, where);
            }
            default:
                throw CfgError(ErrorKind::InvalidData, "schema error: field '" + where + "' cannot be used here", where);
        }
    }

    Value bits(const FieldDesc& f, const std::string& where) {
        check_integer_width(f, where);
        const std::uint8_t* p = take(f.width, where);
        const std::uint64_t word = read_uint_le(p, f.width);
        const unsigned container_bits = static_cast<unsigned>(f.width * 8);

        Value obj = Value::make_object();
        for (const auto& b : f.bits) {
            if (b.width == 0 || b.shift + b.width > container_bits) {
                throw CfgError(ErrorKind::InvalidData,
                               "schema error: bit range '" + join(where, b.name) + "' exceeds its container",
                               join(where, b.name));
            }
            const std::uint64_t sub = extract_bits(word, b.shift, b.width);
            if (b.flag && b.width == 1) {
                obj.set(b.name, Value::make_flag(sub != 0));
            } else {
                obj.set(b.name, Value::make_integer(static_cast<Value::Integer>(sub)));
            }
        }
        return obj;
    }

    void skip_reserved(const FieldDesc& f, const std::string& where) {
        const std::uint8_t* p = take(f.width, where);
        if (!f.must_be_zero) return;
        for (std::size_t i = 0; i < f.width; ++i) {
            if (p[i] != 0) {
                std::ostringstream oss;
                oss << "reserved field '" << where << "' is not zero (byte " << i
                    << " = " << static_cast<unsigned>(p[i]) << ")";
                throw CfgError(ErrorKind::SchemaViolation, oss.str(), where);
            }
        }
    }

    // Resolves a dotted count path ("pkg_num" or "head.pkg_num") against the
    // members decoded so far in the enclosing record.
    static std::int64_t resolve_count(const Value& obj, const std::string& count_path, const std::string& where) {
        const Value* cur = &obj;
        std::size_t start = 0;
        while (cur && start <= count_path.size()) {
            auto dot = count_path.find('.', start);
            if (dot == std::string::npos) dot = count_path.size();
            cur = cur->find(count_path.substr(start, dot - start));
            if (dot == count_path.size()) break;
            start = dot + 1;
        }
        if (!cur || !cur->is_integer()) {
            throw CfgError(ErrorKind::InvalidData,
                           "schema error: count field '" + count_path + "' for '" + where + "' is not a decoded integer",
                           where);
        }
        return cur->as_integer();
    }

    Value repeated(const FieldDesc& f, const Value& obj, const std::string& where) {
        if (f.element.size() != 1 || !f.count_field) {
            throw CfgError(ErrorKind::InvalidData, "schema error: repeat '" + where + "' is malformed", where);
        }
        const FieldDesc& elem = f.element.front();
        if (elem.kind == FieldKind::Repeat || elem.kind == FieldKind::Reserved) {
            throw CfgError(ErrorKind::InvalidData, "schema error: repeat '" + where + "' has unsupported element", where);
        }

        const std::int64_t count = resolve_count(obj, f.count_field, where);
        if (count < 0) {
            throw CfgError(ErrorKind::SchemaViolation,
                           "negative repeat count " + std::to_string(count) + " for '" + where + "'",
                           where);
        }

        const std::size_t n = static_cast<std::size_t>(count);
        const std::size_t elem_size = min_size(elem);
        const std::size_t remaining = size_ - pos_;
        if (elem_size != 0 && n > remaining / elem_size) {
            const std::size_t max = (std::numeric_limits<std::size_t>::max)();
            const std::size_t required = n > max / elem_size ? max : n * elem_size;
            throw_truncated(where, required, remaining);
        }

        Value::Array arr;
        arr.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            arr.push_back(field(elem, indexed(where, i)));
        }
        return Value::make_array(std::move(arr));
    }
};

Decoded decode_record(
    const Schema& schema,
    const std::uint8_t* data,
    std::size_t size,
    const std::string& path
) {
    if (!data) size = 0;
    Walker w(data, size);
    Decoded out;
    out.value = w.record(schema, path);
    out.consumed = w.cursor();
    return out;
}

Decoded decode_record(
    const Schema& schema,
    const std::vector<std::uint8_t>& buf,
    std::size_t offset,
    const std::string& path
) {
    if (offset > buf.size()) {
        throw_truncated(path, offset + min_size(schema), buf.size());
    }
    return decode_record(schema, buf.data() + offset, buf.size() - offset, path);
}

} // namespace gtx8cfg
