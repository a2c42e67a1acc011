#include "gtx8cfg/cfg_bin.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>
#include <string>
#include <vector>

// FTXUI TUI
#include <ftxui/component/component.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/component_base.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>


namespace {

// ----------------- UI tree -----------------

struct UiNode {
    std::string name;
    std::string full_path; // dotted, with [i] for array elements; empty for root
    const gtx8cfg::Value* value{nullptr};
    std::vector<UiNode> children;
};

struct UiRow {
    const UiNode* node{nullptr};
    int depth{0};
    bool is_dir{false};
};

static void ui_build(UiNode& node) {
    const gtx8cfg::Value& v = *node.value;
    if (v.is_object()) {
        for (const auto& kv : v.as_object()) {
            UiNode child;
            child.name = kv.first;
            child.full_path = node.full_path.empty() ? kv.first : node.full_path + "." + kv.first;
            child.value = &kv.second;
            ui_build(child);
            node.children.push_back(std::move(child));
        }
    } else if (v.is_array()) {
        const auto& arr = v.as_array();
        for (std::size_t i = 0; i < arr.size(); ++i) {
            UiNode child;
            child.name = "[" + std::to_string(i) + "]";
            child.full_path = node.full_path + child.name;
            child.value = &arr[i];
            ui_build(child);
            node.children.push_back(std::move(child));
        }
    }
}

static void flatten_rows(const UiNode& node,
                         const std::set<std::string>& expanded,
                         int depth,
                         std::vector<UiRow>& out) {
    // Root itself is not rendered; render its children.
    for (const auto& child : node.children) {
        bool is_dir = child.value->is_object() || child.value->is_array();
        out.push_back(UiRow{&child, depth, is_dir});
        if (is_dir && expanded.find(child.full_path) != expanded.end()) {
            flatten_rows(child, expanded, depth + 1, out);
        }
    }
}

static const UiRow* safe_row_at(const std::vector<UiRow>& rows, int idx) {
    if (rows.empty()) return nullptr;
    if (idx < 0) return nullptr;
    if ((std::size_t)idx >= rows.size()) return nullptr;
    return &rows[(std::size_t)idx];
}

// ----------------- Value preview -----------------

static std::string hex_of(std::uint64_t v, int width) {
    std::ostringstream oss;
    oss << "0x" << std::uppercase << std::hex << std::setw(width) << std::setfill('0') << v;
    return oss.str();
}

static std::string row_meta(const gtx8cfg::Value& v) {
    if (v.is_integer()) return std::to_string(v.as_integer());
    if (v.is_flag()) return v.as_flag() ? "true" : "false";
    return std::string(gtx8cfg::type_name(v)) + "[" + std::to_string(v.size()) + "]";
}

// 16 bytes per line: offset, hex, printable ASCII.
static std::vector<std::string> hex_dump(const gtx8cfg::Value::Bytes& b, std::size_t max_lines) {
    std::vector<std::string> lines;
    for (std::size_t off = 0; off < b.size() && lines.size() < max_lines; off += 16) {
        std::ostringstream oss;
        oss << std::hex << std::setw(4) << std::setfill('0') << off << "  ";
        std::string ascii;
        for (std::size_t i = off; i < off + 16; ++i) {
            if (i < b.size()) {
                oss << std::setw(2) << static_cast<unsigned>(b[i]) << ' ';
                ascii.push_back(std::isprint(b[i]) ? static_cast<char>(b[i]) : '.');
            } else {
                oss << "   ";
            }
        }
        oss << ' ' << ascii;
        lines.push_back(oss.str());
    }
    if (b.size() > max_lines * 16) lines.push_back("...");
    return lines;
}

struct StatusKV {
    std::string k;
    std::string v;
};

static std::vector<StatusKV> describe(const UiNode& n) {
    const gtx8cfg::Value& v = *n.value;
    std::vector<StatusKV> kv;
    kv.push_back({"type", gtx8cfg::type_name(v)});
    if (v.is_integer()) {
        kv.push_back({"dec", std::to_string(v.as_integer())});
        kv.push_back({"hex", hex_of(static_cast<std::uint64_t>(v.as_integer()), 2)});
    } else if (v.is_flag()) {
        kv.push_back({"value", v.as_flag() ? "true" : "false"});
    } else if (v.is_bytes()) {
        kv.push_back({"len", std::to_string(v.size())});
        std::string text = gtx8cfg::c_string(v.as_bytes());
        bool printable = !text.empty() &&
                         std::all_of(text.begin(), text.end(), [](char c) { return std::isprint(static_cast<unsigned char>(c)) != 0; });
        if (printable) kv.push_back({"text", text});
        kv.push_back({"crc32", hex_of(gtx8cfg::crc32_of(v.as_bytes()), 8)});
    } else {
        kv.push_back({"members", std::to_string(v.size())});
    }
    return kv;
}

static ftxui::Element render_preview(const UiNode* n) {
    using namespace ftxui;

    if (!n || !n->value->is_bytes()) {
        return text("(no preview)") | color(Color::GrayDark);
    }
    std::vector<Element> els;
    for (const auto& line : hex_dump(n->value->as_bytes(), 512)) {
        els.push_back(text(line) | color(Color::GrayLight));
    }
    if (els.empty()) els.push_back(text("(empty)") | color(Color::GrayDark));
    return vbox(std::move(els));
}

static void usage() {
    std::cerr <<
        "gtx8cfg_browse - interactive GTX8 cfg group browser\n"
        "\n"
        "Usage:\n"
        "  gtx8cfg_browse <FILE> [--no-validate]\n";
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        usage();
        return 2;
    }
    std::string file = argv[1];
    gtx8cfg::DecodeOptions opts;
    for (int i = 2; i < argc; ++i) {
        std::string opt = argv[i];
        if (opt == "--no-validate") {
            opts.validate = false;
        } else {
            std::cerr << "Unknown option: " << opt << "\n";
            usage();
            return 2;
        }
    }

    try {
        const gtx8cfg::Value doc = gtx8cfg::read_cfg_bin(file, opts);

        UiNode root;
        root.name = "<root>";
        root.value = &doc;
        ui_build(root);

        using namespace ftxui;

        const gtx8cfg::Value& head = doc.at("head");
        const std::string title = "GTX8 " + gtx8cfg::c_string(head.at("bin_version").as_bytes()) + "  " +
                                  std::to_string(head.at("pkg_num").as_integer()) + " package(s)";

        // Packages open by default; their records stay collapsed.
        std::set<std::string> expanded{"head", "cfg_pkgs"};
        int selected = 0;

        std::vector<UiRow> rows;
        auto rebuild = [&] {
            rows.clear();
            flatten_rows(root, expanded, 0, rows);
            selected = rows.empty() ? 0 : std::clamp(selected, 0, (int)rows.size() - 1);
        };
        rebuild();

        auto tree_pane = [&] {
            std::vector<Element> items;
            for (int i = 0; i < (int)rows.size(); ++i) {
                const UiRow& r = rows[(std::size_t)i];
                std::string glyph = "  ";
                if (r.is_dir) glyph = expanded.count(r.node->full_path) ? "- " : "+ ";
                Element line = hbox({
                    text(std::string((std::size_t)r.depth * 2, ' ') + glyph + r.node->name) | color(Color::Cyan) | flex,
                    text(row_meta(*r.node->value)) | color(Color::Yellow),
                });
                if (i == selected) line = line | inverted | focus;
                items.push_back(line);
            }
            return vbox({
                       text(title) | bold,
                       text(file) | color(Color::GrayDark),
                       separator(),
                       vbox(std::move(items)) | vscroll_indicator | frame | flex,
                   }) |
                   size(WIDTH, EQUAL, 60) | border;
        };

        auto detail_pane = [&] {
            const UiRow* r = safe_row_at(rows, selected);
            if (!r) return text("(empty file)") | color(Color::GrayDark) | flex | border;

            std::vector<Element> meta;
            for (const auto& kv : describe(*r->node)) {
                meta.push_back(hbox({
                    text(kv.k) | bold | color(Color::Yellow),
                    text(": ") | color(Color::GrayDark),
                    text(kv.v),
                }));
            }
            return vbox({
                       text(r->node->full_path) | bold | color(Color::Green),
                       separator(),
                       vbox(std::move(meta)),
                       separator(),
                       render_preview(r->node) | vscroll_indicator | frame | flex,
                   }) |
                   flex | border;
        };

        auto screen = ScreenInteractive::Fullscreen();
        auto view = Renderer([&] {
            return vbox({
                hbox({tree_pane(), detail_pane()}) | flex,
                text(" q quit   up/down move   enter toggle   right/left expand/collapse") | color(Color::GrayDark),
            });
        });

        auto app = CatchEvent(view, [&](Event e) {
            if (e == Event::Character('q') || e == Event::Escape) {
                screen.Exit();
                return true;
            }
            const UiRow* r = safe_row_at(rows, selected);
            if (!r) return false;

            if (e == Event::ArrowUp) {
                if (selected > 0) selected--;
                return true;
            }
            if (e == Event::ArrowDown) {
                if (selected + 1 < (int)rows.size()) selected++;
                return true;
            }
            if (!r->is_dir) {
                // Left on a field returns to its record.
                if (e != Event::ArrowLeft) return false;
                while (selected > 0 && rows[(std::size_t)selected].depth >= r->depth) selected--;
                return true;
            }

            const std::string path = r->node->full_path;
            if (e == Event::ArrowRight) {
                expanded.insert(path);
            } else if (e == Event::ArrowLeft) {
                expanded.erase(path);
            } else if (e == Event::Return) {
                if (!expanded.erase(path)) expanded.insert(path);
            } else {
                return false;
            }
            rebuild();
            return true;
        });

        screen.Loop(app);
        return 0;

    } catch (const gtx8cfg::CfgError& e) {
        std::cerr << "Error [" << gtx8cfg::to_string(e.kind()) << "]";
        if (!e.field().empty()) std::cerr << " at " << e.field();
        std::cerr << ": " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
