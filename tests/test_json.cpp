#include "gtx8cfg/cfg_bin.hpp"
#include "gtx8cfg/json.hpp"

#include "cfg_bin_fixture.hpp"

#include <iostream>
#include <limits>
#include <locale>
#include <sstream>
#include <string>
#include <vector>

#define CHECK(cond) do { \
    if (!(cond)) { \
        std::ostringstream _oss; \
        _oss << "CHECK failed: " #cond " at " << __FILE__ << ":" << __LINE__; \
        throw std::runtime_error(_oss.str()); \
    } \
} while (0)

using gtx8cfg::CfgError;
using gtx8cfg::ErrorKind;
using gtx8cfg::Value;
namespace fx = gtx8cfg::fixture;

// JSON has no byte arrays; expand them the way the reader will see them.
static Value expand_bytes(const Value& v) {
    if (v.is_bytes()) {
        Value::Array a;
        for (auto b : v.as_bytes()) a.push_back(Value::make_integer(b));
        return Value::make_array(std::move(a));
    }
    if (v.is_array()) {
        Value::Array a;
        for (const auto& el : v.as_array()) a.push_back(expand_bytes(el));
        return Value::make_array(std::move(a));
    }
    if (v.is_object()) {
        Value::Object o;
        for (const auto& m : v.as_object()) o.emplace_back(m.first, expand_bytes(m.second));
        return Value::make_object(std::move(o));
    }
    return v;
}

static Value small_tree() {
    Value root = Value::make_object();
    root.set("zeta", Value::make_integer(1));
    root.set("alpha", Value::make_bytes({1, 2}));
    root.set("empty", Value::make_object());
    root.set("list", Value::make_array({Value::make_flag(true), Value::make_integer(-7)}));
    root.set("none", Value::make_array());
    return root;
}

static void test_pretty_layout() {
    const std::string expected =
        "{\n"
        "  \"zeta\": 1,\n"
        "  \"alpha\": [\n"
        "    1,\n"
        "    2\n"
        "  ],\n"
        "  \"empty\": {},\n"
        "  \"list\": [\n"
        "    true,\n"
        "    -7\n"
        "  ],\n"
        "  \"none\": []\n"
        "}";
    CHECK(gtx8cfg::to_json(small_tree()) == expected);
}

static void test_compact_layout() {
    gtx8cfg::JsonOptions opts;
    opts.pretty = false;
    CHECK(gtx8cfg::to_json(small_tree(), opts) ==
          "{\"zeta\":1,\"alpha\":[1,2],\"empty\":{},\"list\":[true,-7],\"none\":[]}");
}

// Thousands grouping, as some user locales configure it.
struct GroupingPunct : std::numpunct<char> {
    char do_thousands_sep() const override { return ','; }
    std::string do_grouping() const override { return "\3"; }
};

static void test_writer_ignores_stream_locale() {
    Value root = Value::make_object();
    root.set("bin_len", Value::make_integer(1234567));
    root.set("data", Value::make_bytes({255}));

    std::ostringstream oss;
    oss.imbue(std::locale(std::locale::classic(), new GroupingPunct));
    gtx8cfg::JsonOptions opts;
    opts.pretty = false;
    gtx8cfg::write_json(oss, root, opts);
    CHECK(oss.str() == "{\"bin_len\":1234567,\"data\":[255]}");
    CHECK(gtx8cfg::from_json(oss.str()).at("bin_len").as_integer() == 1234567);
}

static void test_negative_indent() {
    gtx8cfg::JsonOptions opts;
    opts.indent = -4;
    Value root = Value::make_object();
    root.set("a", Value::make_array({Value::make_integer(1)}));
    CHECK(gtx8cfg::to_json(root, opts) == "{\n\"a\": [\n1\n]\n}");
}

static void test_key_escaping() {
    Value root = Value::make_object();
    root.set("a\"b\n", Value::make_integer(0));
    gtx8cfg::JsonOptions opts;
    opts.pretty = false;
    const std::string s = gtx8cfg::to_json(root, opts);
    CHECK(s == "{\"a\\\"b\\n\":0}");
    CHECK(gtx8cfg::from_json(s).as_object()[0].first == "a\"b\n");
}

static void test_reader() {
    Value v = gtx8cfg::from_json(" { \"b\" : [ 1 , -2 , 300 ], \"a\": { \"x\": false } } ");
    CHECK(v.as_object()[0].first == "b");
    CHECK(v.at("b").at(1).as_integer() == -2);
    CHECK(v.at("b").at(2).as_integer() == 300);
    CHECK(v.at("a").at("x").as_flag() == false);

    CHECK(gtx8cfg::from_json("-9223372036854775808").as_integer() == (std::numeric_limits<std::int64_t>::min)());
}

static void test_reader_rejects() {
    const std::vector<std::string> bad = {
        "",
        "{\"a\": \"text\"}",
        "{\"a\": null}",
        "[1.5]",
        "[1e3]",
        "[1,]",
        "{\"a\": 1,}",
        "{\"a\": 1} x",
        "{\"a\": 1, \"a\": 2}",
        "99999999999999999999",
    };
    for (const auto& text : bad) {
        bool threw = false;
        try {
            (void)gtx8cfg::from_json(text);
        } catch (const CfgError& e) {
            threw = e.kind() == ErrorKind::JsonParse;
        }
        CHECK(threw);
    }
}

static void test_structure_round_trip() {
    fx::Package a;
    a.cfg_type = 2;
    a.reg_addrs = {0x1000, 0x1002};
    a.config = {9, 8, 7, 6};
    fx::Package b;
    b.cfg_type = 0;
    auto bin = fx::build_cfg_bin({a, b});

    Value decoded = gtx8cfg::decode_cfg_bin(bin);
    Value reread = gtx8cfg::from_json(gtx8cfg::to_json(decoded));
    CHECK(reread == expand_bytes(decoded));

    gtx8cfg::JsonOptions compact;
    compact.pretty = false;
    CHECK(gtx8cfg::from_json(gtx8cfg::to_json(decoded, compact)) == reread);

    CHECK(reread.at("ic_configs").at("2").at("data").size() == 4);
    CHECK(reread.at("cfg_pkgs").size() == 2);
}

int main() {
    try {
        test_pretty_layout();
        test_compact_layout();
        test_writer_ignores_stream_locale();
        test_negative_indent();
        test_key_escaping();
        test_reader();
        test_reader_rejects();
        test_structure_round_trip();
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    std::cout << "All tests passed.\n";
    return 0;
}
