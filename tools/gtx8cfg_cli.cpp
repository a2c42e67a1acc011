#include "gtx8cfg/cfg_bin.hpp"
#include "gtx8cfg/json.hpp"

#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#if !defined(_WIN32)
#include <unistd.h>
#endif


namespace {

struct Ansi {
    bool enabled{true};

    std::string reset() const { return enabled ? "\x1b[0m" : ""; }
    std::string dim() const { return enabled ? "\x1b[2m" : ""; }
    std::string bold() const { return enabled ? "\x1b[1m" : ""; }
    std::string red() const { return enabled ? "\x1b[31m" : ""; }
    std::string green() const { return enabled ? "\x1b[32m" : ""; }
    std::string yellow() const { return enabled ? "\x1b[33m" : ""; }
    std::string magenta() const { return enabled ? "\x1b[35m" : ""; }
    std::string cyan() const { return enabled ? "\x1b[36m" : ""; }
    std::string gray() const { return enabled ? "\x1b[90m" : ""; }
};

static bool is_tty(FILE* f) {
#if defined(_WIN32)
    (void)f;
    return false;
#else
    return ::isatty(fileno(f));
#endif
}

static std::string hex8(std::uint32_t v) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setw(8) << std::setfill('0') << v;
    return oss.str();
}

static std::string hex_bytes(const gtx8cfg::Value::Bytes& b, std::size_t max_bytes) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < b.size() && i < max_bytes; ++i) {
        if (i) oss << ' ';
        oss << std::setw(2) << static_cast<unsigned>(b[i]);
    }
    if (b.size() > max_bytes) oss << " ...";
    return oss.str();
}

static void usage() {
    std::cerr <<
        "gtx8cfg - Goodix GTX8 cfg group decoder\n"
        "\n"
        "Usage:\n"
        "  gtx8cfg [json] <FILE> [--compact] [--no-validate] [--verbose]\n"
        "  gtx8cfg tree   <FILE> [--max-depth N] [--max-bytes N] [--no-validate] [--no-color]\n"
        "  gtx8cfg summary <FILE> [--no-validate] [--no-color]\n";
}

struct Args {
    std::string cmd{"json"};
    std::string file;
    bool compact{false};
    bool validate{true};
    bool no_color{false};
    bool verbose{false};
    std::size_t max_depth{static_cast<std::size_t>(-1)};
    std::size_t max_bytes{16};
};

static bool is_command(const std::string& s) {
    return s == "json" || s == "tree" || s == "summary";
}

static bool parse_args(int argc, char** argv, Args& a) {
    if (argc < 2) return false;

    int i = 1;
    if (is_command(argv[i])) {
        a.cmd = argv[i++];
    }
    if (i >= argc || std::string(argv[i]).rfind("--", 0) == 0) {
        return false;
    }
    a.file = argv[i++];

    while (i < argc) {
        std::string opt = argv[i++];
        if (opt == "--compact") a.compact = true;
        else if (opt == "--no-validate") a.validate = false;
        else if (opt == "--no-color") a.no_color = true;
        else if (opt == "--verbose") a.verbose = true;
        else if (opt == "--max-depth" && i < argc) a.max_depth = static_cast<std::size_t>(std::stoull(argv[i++]));
        else if (opt == "--max-bytes" && i < argc) a.max_bytes = static_cast<std::size_t>(std::stoull(argv[i++]));
        else {
            std::cerr << "Unknown option: " << opt << "\n";
            return false;
        }
    }
    return true;
}

// ----------------- Tree printer -----------------

static std::string scalar_label(const gtx8cfg::Value& v, std::size_t max_bytes) {
    if (v.is_integer()) {
        std::ostringstream oss;
        oss << v.as_integer();
        return oss.str();
    }
    if (v.is_flag()) return v.as_flag() ? "true" : "false";
    return hex_bytes(v.as_bytes(), max_bytes);
}

static void print_tree(
    const gtx8cfg::Value& node,
    const Ansi& ansi,
    std::size_t indent,
    std::size_t depth,
    std::size_t max_depth,
    std::size_t max_bytes
) {
    if (depth > max_depth) return;

    auto print_child = [&](const std::string& name, const gtx8cfg::Value& child) {
        std::string pad(indent, ' ');
        if (child.is_object() || child.is_array()) {
            std::cout << pad
                      << ansi.magenta() << name << "/" << ansi.reset()
                      << " " << ansi.gray() << "[" << child.size() << "]" << ansi.reset()
                      << "\n";
            print_tree(child, ansi, indent + 2, depth + 1, max_depth, max_bytes);
            return;
        }
        std::cout << pad
                  << ansi.cyan() << name << ansi.reset()
                  << " " << ansi.yellow() << scalar_label(child, max_bytes) << ansi.reset();
        if (child.is_bytes()) {
            std::cout << " " << ansi.gray() << "(" << child.size() << " bytes)" << ansi.reset();
        }
        std::cout << "\n";
    };

    if (node.is_object()) {
        for (const auto& kv : node.as_object()) print_child(kv.first, kv.second);
    } else if (node.is_array()) {
        const auto& arr = node.as_array();
        for (std::size_t i = 0; i < arr.size(); ++i) print_child("[" + std::to_string(i) + "]", arr[i]);
    }
}

// ----------------- Summary -----------------

static void print_summary(const std::vector<std::uint8_t>& bin, const gtx8cfg::Value& root, const Ansi& ansi) {
    const auto& head = root.at("head");
    std::cout << ansi.bold() << "bin_len" << ansi.reset() << ": " << head.at("bin_len").as_integer() << "\n";
    std::cout << ansi.bold() << "bin_version" << ansi.reset() << ": "
              << gtx8cfg::c_string(head.at("bin_version").as_bytes()) << "\n";
    std::cout << ansi.bold() << "checksum" << ansi.reset() << ": " << head.at("checksum").as_integer() << "\n";
    std::cout << ansi.bold() << "packages" << ansi.reset() << ": " << head.at("pkg_num").as_integer() << "\n";

    const auto& offsets = root.at("pkg_offsets").as_array();
    const auto& pkgs = root.at("cfg_pkgs").as_array();

    for (std::size_t i = 0; i < pkgs.size(); ++i) {
        const auto& cnst = pkgs[i].at("cnst_info");
        // Per package: ic_configs holds only the last package of each cfg_type.
        const gtx8cfg::Value::Bytes cfg = gtx8cfg::package_config(bin, root, i);

        std::cout << ansi.cyan() << "[" << i << "]" << ansi.reset()
                  << " off=" << offsets[i].as_integer()
                  << " ic_type=" << ansi.green() << gtx8cfg::c_string(cnst.at("ic_type").as_bytes()) << ansi.reset()
                  << " cfg_type=" << cnst.at("cfg_type").as_integer()
                  << " sensor_id=" << cnst.at("sensor_id").as_integer()
                  << " pkg_len=" << pkgs[i].at("pkg_len").as_integer()
                  << " cfg_len=" << cfg.size()
                  << " " << ansi.yellow() << "crc32=" << hex8(gtx8cfg::crc32_of(cfg)) << ansi.reset()
                  << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    Args a;
    bool args_ok = false;
    try {
        args_ok = parse_args(argc, argv, a);
    } catch (const std::exception& e) {
        std::cerr << "Invalid option value: " << e.what() << "\n";
    }
    if (!args_ok) {
        usage();
        return 2;
    }

    Ansi ansi;
    ansi.enabled = !a.no_color && is_tty(stdout);
    Ansi err_ansi;
    err_ansi.enabled = !a.no_color && is_tty(stderr);

    try {
        std::vector<std::uint8_t> bin = gtx8cfg::read_bin_file(a.file);
        if (a.verbose) {
            std::cerr << err_ansi.dim() << "read " << bin.size() << " bytes from " << a.file << err_ansi.reset() << "\n";
        }

        gtx8cfg::DecodeOptions opts;
        opts.validate = a.validate;
        gtx8cfg::Value root = gtx8cfg::decode_cfg_bin(bin, opts);

        if (a.verbose) {
            const auto& offsets = root.at("pkg_offsets").as_array();
            std::cerr << err_ansi.dim() << "decoded " << offsets.size() << " package(s)";
            for (const auto& o : offsets) std::cerr << " @" << o.as_integer();
            std::cerr << err_ansi.reset() << "\n";
        }

        if (a.cmd == "json") {
            gtx8cfg::JsonOptions jo;
            jo.pretty = !a.compact;
            std::cout << gtx8cfg::to_json(root, jo) << "\n";
            return 0;
        }

        if (a.cmd == "tree") {
            std::cout << ansi.bold() << "GTX8 cfg group" << ansi.reset() << ": " << a.file << "\n";
            print_tree(root, ansi, 0, 0, a.max_depth, a.max_bytes);
            return 0;
        }

        if (a.cmd == "summary") {
            print_summary(bin, root, ansi);
            return 0;
        }

    } catch (const gtx8cfg::CfgError& e) {
        std::cerr << err_ansi.red() << "Error" << err_ansi.reset()
                  << " [" << gtx8cfg::to_string(e.kind()) << "]";
        if (!e.field().empty()) std::cerr << " at " << err_ansi.cyan() << e.field() << err_ansi.reset();
        std::cerr << ": " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << err_ansi.red() << "Error" << err_ansi.reset() << ": " << e.what() << "\n";
        return 1;
    }

    usage();
    return 2;
}
