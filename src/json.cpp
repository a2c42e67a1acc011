#include "gtx8cfg/json.hpp"

#include <cstring>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>
#include <string_view>

namespace gtx8cfg {

// ------------------------------
// Writer
// ------------------------------

static void json_escape_string(std::ostream& os, const std::string& s) {
    os << '"';
    for (unsigned char c : s) {
        switch (c) {
            case '"': os << "\\\""; break;
            case '\\': os << "\\\\"; break;
            case '\b': os << "\\b"; break;
            case '\f': os << "\\f"; break;
            case '\n': os << "\\n"; break;
            case '\r': os << "\\r"; break;
            case '\t': os << "\\t"; break;
            default:
                if (c < 0x20) {
                    os << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                       << static_cast<int>(c) << std::dec << std::setw(0);
                } else {
                    os << static_cast<char>(c);
                }
        }
    }
    os << '"';
}

namespace {

class JsonWriter {
public:
    JsonWriter(std::ostream& os, const JsonOptions& opts) : os_(os), opts_(opts) {}

    void value(const Value& v, int depth) {
        if (v.is_integer()) {
            // Numbers bypass the stream's locale; a grouping facet would corrupt them.
            os_ << std::to_string(v.as_integer());
        } else if (v.is_flag()) {
            os_ << (v.as_flag() ? "true" : "false");
        } else if (v.is_bytes()) {
            const auto& b = v.as_bytes();
            open('[');
            for (std::size_t i = 0; i < b.size(); ++i) {
                separator(i, depth + 1);
                os_ << std::to_string(static_cast<unsigned>(b[i]));
            }
            close(']', b.empty(), depth);
        } else if (v.is_array()) {
            const auto& a = v.as_array();
            open('[');
            for (std::size_t i = 0; i < a.size(); ++i) {
                separator(i, depth + 1);
                value(a[i], depth + 1);
            }
            close(']', a.empty(), depth);
        } else {
            const auto& o = v.as_object();
            open('{');
            for (std::size_t i = 0; i < o.size(); ++i) {
                separator(i, depth + 1);
                json_escape_string(os_, o[i].first);
                os_ << (opts_.pretty ? ": " : ":");
                value(o[i].second, depth + 1);
            }
            close('}', o.empty(), depth);
        }
    }

private:
    std::ostream& os_;
    const JsonOptions& opts_;

    void open(char c) { os_ << c; }

    void newline(int depth) {
        if (!opts_.pretty) return;
        const int width = opts_.indent > 0 ? depth * opts_.indent : 0;
        os_ << '\n' << std::string(static_cast<std::size_t>(width), ' ');
    }

    void separator(std::size_t i, int depth) {
        if (i) os_ << ',';
        newline(depth);
    }

    void close(char c, bool empty, int depth) {
        if (!empty) newline(depth);
        os_ << c;
    }
};

} // namespace

void write_json(std::ostream& os, const Value& v, const JsonOptions& opts) {
    JsonWriter w(os, opts);
    w.value(v, 0);
}

std::string to_json(const Value& v, const JsonOptions& opts) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    write_json(oss, v, opts);
    return oss.str();
}

// ------------------------------
// Reader
// ------------------------------

namespace {

class JsonParser {
public:
    explicit JsonParser(std::string_view s) : s_(s) {}

    Value parse() {
        skip_ws();
        Value out = parse_value();
        skip_ws();
        if (pos_ != s_.size()) {
            fail("trailing data in JSON");
        }
        return out;
    }

private:
    std::string_view s_;
    std::size_t pos_{0};

    [[noreturn]] void fail(const std::string& msg) const {
        throw CfgError(ErrorKind::JsonParse, msg + " at offset " + std::to_string(pos_));
    }

    void skip_ws() {
        while (pos_ < s_.size()) {
            char c = s_[pos_];
            if (c == ' ' || c == '\n' || c == '\r' || c == '\t') {
                ++pos_;
                continue;
            }
            break;
        }
    }

    char peek() const { return pos_ < s_.size() ? s_[pos_] : '\0'; }

    char get() {
        if (pos_ >= s_.size()) {
            fail("unexpected end of JSON");
        }
        return s_[pos_++];
    }

    static void append_utf8(std::string& out, unsigned codepoint) {
        if (codepoint <= 0x7F) {
            out.push_back(static_cast<char>(codepoint));
        } else if (codepoint <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((codepoint >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xE0 | ((codepoint >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        }
    }

    unsigned parse_hex4() {
        unsigned v = 0;
        for (int i = 0; i < 4; ++i) {
            char c = get();
            v <<= 4;
            if (c >= '0' && c <= '9') v |= static_cast<unsigned>(c - '0');
            else if (c >= 'a' && c <= 'f') v |= static_cast<unsigned>(10 + (c - 'a'));
            else if (c >= 'A' && c <= 'F') v |= static_cast<unsigned>(10 + (c - 'A'));
            else fail("invalid \\u escape");
        }
        return v;
    }

    // Object keys only; string values have no place in a decoded tree.
    std::string parse_string() {
        // assumes opening quote already consumed
        std::string out;
        while (true) {
            char c = get();
            if (c == '"') break;
            if (c == '\\') {
                char e = get();
                switch (e) {
                    case '"': out.push_back('"'); break;
                    case '\\': out.push_back('\\'); break;
                    case '/': out.push_back('/'); break;
                    case 'b': out.push_back('\b'); break;
                    case 'f': out.push_back('\f'); break;
                    case 'n': out.push_back('\n'); break;
                    case 'r': out.push_back('\r'); break;
                    case 't': out.push_back('\t'); break;
                    case 'u': append_utf8(out, parse_hex4()); break;
                    default:
                        fail("invalid escape in JSON string");
                }
            } else {
                out.push_back(c);
            }
        }
        return out;
    }

    Value parse_number() {
        std::size_t start = pos_;
        bool negative = false;
        if (peek() == '-') {
            negative = true;
            ++pos_;
        }
        std::uint64_t mag = 0;
        std::size_t digits = 0;
        while (pos_ < s_.size() && s_[pos_] >= '0' && s_[pos_] <= '9') {
            const unsigned d = static_cast<unsigned>(s_[pos_] - '0');
            if (mag > ((std::numeric_limits<std::uint64_t>::max)() - d) / 10) {
                pos_ = start;
                fail("integer out of range");
            }
            mag = mag * 10 + d;
            ++digits;
            ++pos_;
        }
        if (digits == 0) {
            pos_ = start;
            fail("invalid number in JSON");
        }
        const char c = peek();
        if (c == '.' || c == 'e' || c == 'E') {
            pos_ = start;
            fail("non-integer number in JSON");
        }
        const auto limit = static_cast<std::uint64_t>((std::numeric_limits<std::int64_t>::max)());
        if (mag > limit + (negative ? 1u : 0u)) {
            pos_ = start;
            fail("integer out of range");
        }
        if (negative) {
            return Value::make_integer(mag == limit + 1 ? (std::numeric_limits<std::int64_t>::min)()
                                                        : -static_cast<std::int64_t>(mag));
        }
        return Value::make_integer(static_cast<std::int64_t>(mag));
    }

    Value parse_array() {
        // assumes '[' consumed
        Value::Array arr;
        skip_ws();
        if (peek() == ']') {
            get();
            return Value::make_array(std::move(arr));
        }
        while (true) {
            skip_ws();
            arr.push_back(parse_value());
            skip_ws();
            char c = get();
            if (c == ']') break;
            if (c != ',') fail("expected ',' in array");
        }
        return Value::make_array(std::move(arr));
    }

    Value parse_object() {
        // assumes '{' consumed
        Value obj = Value::make_object();
        skip_ws();
        if (peek() == '}') {
            get();
            return obj;
        }
        while (true) {
            skip_ws();
            if (get() != '"') fail("expected string key");
            std::string key = parse_string();
            skip_ws();
            if (get() != ':') fail("expected ':' in object");
            skip_ws();
            if (obj.find(key)) fail("duplicate key '" + key + "'");
            obj.as_object().emplace_back(std::move(key), parse_value());
            skip_ws();
            char c = get();
            if (c == '}') break;
            if (c != ',') fail("expected ',' in object");
        }
        return obj;
    }

    Value parse_value() {
        skip_ws();
        char c = peek();
        if (c == '{') { get(); return parse_object(); }
        if (c == '[') { get(); return parse_array(); }
        if (c == 't') { expect("true"); return Value::make_flag(true); }
        if (c == 'f') { expect("false"); return Value::make_flag(false); }
        if (c == '"') fail("string values are not supported");
        if (c == 'n') fail("null is not supported");
        return parse_number();
    }

    void expect(const char* lit) {
        std::size_t n = std::strlen(lit);
        if (pos_ + n > s_.size() || s_.substr(pos_, n) != lit) {
            fail(std::string("expected '") + lit + "'");
        }
        pos_ += n;
    }
};

} // namespace

Value from_json(const std::string& text) {
    JsonParser p(text);
    return p.parse();
}

} // namespace gtx8cfg
