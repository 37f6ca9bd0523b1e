#include "gff/gff.hpp"
#include "gff/gff_easy.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>
#include <string>
#include <vector>

// FTXUI TUI
#include <ftxui/component/component.hpp>
#include <ftxui/component/component_base.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/terminal.hpp>

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

static bool is_tty() {
#if defined(_WIN32)
    return false;
#else
    return ::isatty(fileno(stdout));
#endif
}

static std::string hex8(std::uint32_t v) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setw(8) << std::setfill('0') << v;
    return oss.str();
}

static void usage() {
    std::cerr <<
        "gff_cli (C++) - GFF resource inspector\n"
        "\n"
        "Usage:\n"
        "  gff_cli info      <FILE> [--strict] [--no-color]\n"
        "  gff_cli tree      <FILE> [--max-depth N] [--strict] [--no-color]\n"
        "  gff_cli get       <FILE> <PATH> [--strict] [--no-color]\n"
        "  gff_cli diff      <FILE> <OTHER> [--strict] [--no-color]\n"
        "  gff_cli roundtrip <FILE> [--no-dedupe] [--strict] [--no-color]\n"
        "  gff_cli view      <FILE> [--strict]\n"
        "\n"
        "PATH steps are separated by '\\' or '/'; list entries are addressed by index.\n";
}

struct Args {
    std::string cmd;
    std::string file;
    std::string operand; // PATH for get, OTHER for diff
    bool strict{false};
    bool no_dedupe{false};
    bool no_color{false};
    std::size_t max_depth{static_cast<std::size_t>(-1)};
};

static bool parse_args(int argc, char** argv, Args& a) {
    if (argc < 3) return false;
    a.cmd = argv[1];
    a.file = argv[2];

    int i = 3;
    if (a.cmd == "get" || a.cmd == "diff") {
        if (i >= argc || std::string(argv[i]).rfind("--", 0) == 0) {
            std::cerr << "Missing operand for " << a.cmd << "\n";
            return false;
        }
        a.operand = argv[i++];
    }

    while (i < argc) {
        std::string opt = argv[i++];
        if (opt == "--strict") a.strict = true;
        else if (opt == "--no-dedupe") a.no_dedupe = true;
        else if (opt == "--no-color") a.no_color = true;
        else if (opt == "--max-depth" && i < argc) a.max_depth = static_cast<std::size_t>(std::stoull(argv[i++]));
        else {
            std::cerr << "Unknown option: " << opt << "\n";
            return false;
        }
    }

    if (a.cmd != "info" && a.cmd != "tree" && a.cmd != "get" && a.cmd != "diff" &&
        a.cmd != "roundtrip" && a.cmd != "view") {
        std::cerr << "Unknown command: " << a.cmd << "\n";
        return false;
    }
    return true;
}

// ----------------- Tree printer -----------------

static void print_struct(const gff::GffStruct& s, const Ansi& ansi, std::size_t indent, std::size_t depth,
                         std::size_t max_depth);

static void print_field(const gff::GffField& f, const Ansi& ansi, std::size_t indent, std::size_t depth,
                        std::size_t max_depth) {
    std::string pad(indent, ' ');
    const gff::GffFieldType t = f.type();

    if (t == gff::GffFieldType::Struct) {
        const auto& child = std::get<gff::GffStruct>(f.value);
        std::cout << pad << ansi.magenta() << f.label() << "/" << ansi.reset()
                  << " " << ansi.gray() << "Struct type=" << child.type_id() << ansi.reset() << "\n";
        if (depth < max_depth) print_struct(child, ansi, indent + 2, depth + 1, max_depth);
        return;
    }

    if (t == gff::GffFieldType::List) {
        const auto& list = std::get<gff::GffList>(f.value);
        std::cout << pad << ansi.magenta() << f.label() << "[]" << ansi.reset()
                  << " " << ansi.gray() << "List (" << list.size() << ")" << ansi.reset() << "\n";
        if (depth >= max_depth) return;
        for (std::size_t i = 0; i < list.size(); ++i) {
            std::cout << pad << "  " << ansi.magenta() << "[" << i << "]" << ansi.reset()
                      << " " << ansi.gray() << "type=" << list[i].type_id() << ansi.reset() << "\n";
            if (depth + 1 < max_depth) print_struct(list[i], ansi, indent + 4, depth + 2, max_depth);
        }
        return;
    }

    std::cout << pad << ansi.cyan() << f.label() << ansi.reset()
              << " " << ansi.gray() << gff::to_string(t) << ansi.reset()
              << " " << ansi.yellow() << gff::to_display_string(f.value) << ansi.reset() << "\n";
}

static void print_struct(const gff::GffStruct& s, const Ansi& ansi, std::size_t indent, std::size_t depth,
                         std::size_t max_depth) {
    for (const auto& f : s) {
        print_field(f, ansi, indent, depth, max_depth);
    }
}


// ----------------- Interactive UI tree (FTXUI) -----------------

struct UiNode {
    std::string name;
    std::string full_path; // backslash-separated; empty for root
    const gff::GffField* field{nullptr};
    const gff::GffStruct* entry{nullptr}; // set for list entries
    std::vector<UiNode> children;
};

struct UiRow {
    const UiNode* node{nullptr};
    int depth{0};
    bool is_dir{false};
};

static std::string join_path(const std::string& parent, const std::string& step) {
    return parent.empty() ? step : parent + "\\" + step;
}

static void ui_build(UiNode& node, const gff::GffStruct& s) {
    for (const auto& f : s) {
        UiNode child;
        child.name = f.label();
        child.full_path = join_path(node.full_path, f.label());
        child.field = &f;
        if (f.type() == gff::GffFieldType::Struct) {
            ui_build(child, std::get<gff::GffStruct>(f.value));
        } else if (f.type() == gff::GffFieldType::List) {
            const auto& list = std::get<gff::GffList>(f.value);
            for (std::size_t i = 0; i < list.size(); ++i) {
                UiNode e;
                e.name = "[" + std::to_string(i) + "]";
                e.full_path = join_path(child.full_path, std::to_string(i));
                e.entry = &list[i];
                ui_build(e, list[i]);
                child.children.push_back(std::move(e));
            }
        }
        node.children.push_back(std::move(child));
    }
}

static bool ui_is_dir(const UiNode& n) {
    if (n.entry) return true;
    return n.field && (n.field->type() == gff::GffFieldType::Struct || n.field->type() == gff::GffFieldType::List);
}

static void flatten_rows(const UiNode& node,
                         const std::set<std::string>& expanded,
                         int depth,
                         std::vector<UiRow>& out) {
    // Root itself is not rendered; render its children.
    for (const auto& child : node.children) {
        bool is_dir = ui_is_dir(child);
        out.push_back(UiRow{&child, depth, is_dir});
        if (is_dir && expanded.find(child.full_path) != expanded.end()) {
            flatten_rows(child, expanded, depth + 1, out);
        }
    }
}

static std::string row_meta(const UiNode& n) {
    if (n.entry) return "type=" + std::to_string(n.entry->type_id());
    if (!n.field) return "";
    if (n.field->type() == gff::GffFieldType::List) {
        return "List (" + std::to_string(std::get<gff::GffList>(n.field->value).size()) + ")";
    }
    return gff::to_string(n.field->type());
}

static const UiRow* safe_row_at(const std::vector<UiRow>& rows, int idx) {
    if (rows.empty()) return nullptr;
    if (idx < 0) return nullptr;
    if ((std::size_t)idx >= rows.size()) return nullptr;
    return &rows[(std::size_t)idx];
}

struct StatusKV {
    std::string k;
    std::string v;
};

static std::vector<StatusKV> describe_node(const UiNode& n) {
    std::vector<StatusKV> out;
    const gff::GffStruct* s = n.entry;
    if (n.field) {
        out.push_back({"label", n.field->label()});
        out.push_back({"kind", gff::to_string(n.field->type())});
        out.push_back({"tag", std::to_string(static_cast<std::uint32_t>(n.field->type()))});
        if (n.field->type() == gff::GffFieldType::Struct) {
            s = &std::get<gff::GffStruct>(n.field->value);
        } else if (n.field->type() == gff::GffFieldType::List) {
            out.push_back({"entries", std::to_string(std::get<gff::GffList>(n.field->value).size())});
        } else {
            out.push_back({"inline", gff::is_inline(n.field->type()) ? "true" : "false"});
        }
    }
    if (s) {
        out.push_back({"type_id", std::to_string(s->type_id())});
        out.push_back({"fields", std::to_string(s->size())});
    }
    return out;
}

static ftxui::Element render_value(const UiNode& n) {
    using namespace ftxui;

    if (n.field && !ui_is_dir(n)) {
        const gff::GffValue& v = n.field->value;
        if (n.field->type() == gff::GffFieldType::LocString) {
            const auto& loc = std::get<gff::LocalizedString>(v);
            std::vector<Element> els;
            els.push_back(hbox({text("strref") | bold | color(Color::Yellow),
                                text("=") | color(Color::GrayDark),
                                text(std::to_string(loc.stringref())) | color(Color::GrayLight)}));
            for (const auto& kv : loc.substrings()) {
                auto lg = gff::LocalizedString::split_substring_id(kv.first);
                std::string key = "lang " + std::to_string(static_cast<std::uint32_t>(lg.first)) +
                                  (lg.second == gff::Gender::Female ? " female" : " male");
                els.push_back(hbox({text(key) | bold | color(Color::Yellow),
                                    text("=") | color(Color::GrayDark),
                                    text("\"" + kv.second + "\"") | color(Color::Green) | flex}));
            }
            return vbox(std::move(els));
        }
        if (n.field->type() == gff::GffFieldType::Binary) {
            const auto& b = std::get<gff::Binary>(v);
            std::ostringstream oss;
            std::size_t show = std::min<std::size_t>(b.size(), 64);
            for (std::size_t i = 0; i < show; ++i) {
                oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b[i]) << ' ';
            }
            if (show < b.size()) oss << "...";
            return paragraph(oss.str()) | color(Color::GrayLight);
        }
        return paragraph(gff::to_display_string(v)) | color(Color::Green);
    }

    std::vector<Element> els;
    for (const auto& c : n.children) {
        els.push_back(hbox({text(c.name) | color(Color::Cyan), text("  "), text(row_meta(c)) | color(Color::Yellow)}));
    }
    if (els.empty()) return text("(empty)") | color(Color::GrayDark);
    return vbox(std::move(els));
}

// ----------------- End UI tree helpers -----------------

static int run_view(const Args& a, const gff::GffDocument& doc) {
    using namespace ftxui;

    UiNode root;
    root.name = "<root>";
    ui_build(root, doc.root());

    std::set<std::string> expanded;
    int selected = 0;
    int left_scroll = 0; // first visible row index in left pane

    std::vector<StatusKV> status_kv;
    const UiNode* shown = nullptr;
    std::string selected_path;

    auto rebuild = [&]() -> std::vector<UiRow> {
        std::vector<UiRow> out;
        flatten_rows(root, expanded, 0, out);
        if (out.empty()) {
            selected = 0;
        } else {
            if (selected < 0) selected = 0;
            if (selected >= (int)out.size()) selected = (int)out.size() - 1;
        }
        return out;
    };

    auto rows = rebuild();

    auto load_preview_for_selected = [&]() {
        const UiRow* pr = safe_row_at(rows, selected);
        if (!pr || !pr->node) return;
        shown = pr->node;
        selected_path = shown->full_path;
        status_kv = describe_node(*shown);
    };

    load_preview_for_selected();

    auto left_pane = Renderer([&] {
        rows = rebuild();

        // The left pane scrolls inside its own viewport.
        auto dim = ftxui::Terminal::Size();
        int term_h = std::max(10, dim.dimy);
        int visible_rows = std::max(3, term_h - 6);

        int total = (int)rows.size();
        if (total <= 0) {
            left_scroll = 0;
        } else {
            left_scroll = std::max(0, std::min(left_scroll, std::max(0, total - visible_rows)));
            if (selected < left_scroll) left_scroll = selected;
            if (selected >= left_scroll + visible_rows) left_scroll = selected - visible_rows + 1;
            left_scroll = std::max(0, std::min(left_scroll, std::max(0, total - visible_rows)));
        }

        int begin = left_scroll;
        int end = std::min(total, begin + visible_rows);

        std::vector<Element> items;
        items.reserve((std::size_t)std::max(0, end - begin) + 2);

        constexpr int kLeftLineMax = 58; // pane width is 60, leave room for borders

        if (begin > 0) {
            items.push_back(text("↑ more") | color(Color::GrayDark));
        }

        for (int i = begin; i < end; ++i) {
            const UiRow& r = rows[(std::size_t)i];
            const UiNode* n = r.node;

            std::string glyph = "• ";
            if (r.is_dir) glyph = (expanded.find(n->full_path) != expanded.end()) ? "▾ " : "▸ ";

            std::string indent((std::size_t)r.depth * 2, ' ');

            Element left_txt = text(indent + glyph + n->name) | color(r.is_dir ? Color::Magenta : Color::Cyan) | flex;
            Element right_txt = text(row_meta(*n)) | color(Color::Yellow);
            Element line = hbox({left_txt, right_txt}) | size(WIDTH, LESS_THAN, kLeftLineMax);

            if (i == selected) {
                line = line | inverted;
            }
            items.push_back(line);
        }

        if (end < total) {
            items.push_back(text("↓ more") | color(Color::GrayDark));
        }

        auto header = hbox({
            text(doc.content_tag()) | bold | color(Color::White),
            text("  "),
            text(a.file) | color(Color::GrayDark),
            filler(),
            text("q") | bold | color(Color::Yellow),
            text(" quit  ") | color(Color::GrayDark),
            text("←→") | bold | color(Color::Yellow),
            text(" collapse/expand  ") | color(Color::GrayDark),
            text("↑↓") | bold | color(Color::Yellow),
            text(" move  ") | color(Color::GrayDark),
            text("Enter") | bold | color(Color::Yellow),
            text(" inspect") | color(Color::GrayDark)
        });

        return vbox({
                   header,
                   separator(),
                   vbox(std::move(items)) | flex,
               }) |
               flex |
               border;
    });

    auto right_pane = Renderer([&] {
        std::vector<Element> meta_lines;
        meta_lines.reserve(status_kv.size() + 1);
        for (const auto& kv : status_kv) {
            meta_lines.push_back(
                hbox({
                    text(kv.k) | bold | color(Color::Yellow),
                    text(": ") | color(Color::GrayDark),
                    text(kv.v) | color(Color::GrayLight) | flex,
                })
            );
        }
        if (meta_lines.empty()) {
            meta_lines.push_back(text("(no metadata)") | color(Color::GrayDark));
        }

        Element top = vbox({
            text(selected_path.empty() ? "<root>" : selected_path) | bold | color(Color::Green),
            separator(),
            vbox(std::move(meta_lines)) | flex,
        }) | vscroll_indicator | frame | size(HEIGHT, LESS_THAN, 10) | flex;

        Element body = vbox({
            text("value") | bold | color(Color::Magenta),
            separator(),
            shown ? render_value(*shown) | flex : text("(nothing selected)") | color(Color::GrayDark),
        }) | vscroll_indicator | frame | flex;

        return vbox({top, separator(), body}) |
               flex |
               border;
    });

    auto layout = Renderer([&] {
        int left_w = 60;

        // Clamp the whole UI to the terminal viewport.
        auto dim = ftxui::Terminal::Size();
        int term_w = std::max(20, dim.dimx);
        int term_h = std::max(10, dim.dimy);

        auto ui = hbox({
            left_pane->Render() | size(WIDTH, EQUAL, left_w),
            right_pane->Render() | flex,
        }) | flex;

        return ui
            | size(WIDTH, EQUAL, term_w)
            | size(HEIGHT, EQUAL, term_h);
    });

    auto screen = ScreenInteractive::TerminalOutput();
    screen.TrackMouse(true);

    auto app = CatchEvent(layout, [&](Event e) {
        rows = rebuild();

        if (e == Event::Character('q') || e == Event::Escape) {
            screen.Exit();
            return true;
        }
        const UiRow* pr = safe_row_at(rows, selected);
        if (!pr) return false;
        const UiRow& r = *pr;

        if (e == Event::ArrowUp) {
            if (selected > 0) selected--;
            return true;
        }
        if (e == Event::ArrowDown) {
            if (selected + 1 < (int)rows.size()) selected++;
            return true;
        }
        if (e == Event::PageUp) {
            selected = std::max(0, selected - 25);
            return true;
        }
        if (e == Event::PageDown) {
            selected = std::min((int)rows.size() - 1, selected + 25);
            return true;
        }

        if (e.is_mouse()) {
            auto m = e.mouse();
            if (m.button == Mouse::WheelUp) {
                selected = std::max(0, selected - 3);
                return true;
            }
            if (m.button == Mouse::WheelDown) {
                selected = std::min((int)rows.size() - 1, selected + 3);
                return true;
            }
        }

        if (e == Event::ArrowRight) {
            if (r.is_dir) expanded.insert(r.node->full_path);
            return true;
        }
        if (e == Event::ArrowLeft) {
            if (r.is_dir) expanded.erase(r.node->full_path);
            return true;
        }
        if (e == Event::Return) {
            load_preview_for_selected();
            return true;
        }

        return false;
    });

    screen.Loop(app);
    return 0;
}

static void print_span(const Ansi& ansi, const char* name, const gff::RegionSpan& span, const char* unit) {
    std::cout << "  " << ansi.cyan() << std::left << std::setw(14) << name << ansi.reset()
              << " offset=" << std::setw(8) << span.offset
              << " " << unit << "=" << span.count << "\n";
}

} // namespace

int main(int argc, char** argv) {
    Args a;
    if (!parse_args(argc, argv, a)) {
        usage();
        return 2;
    }

    Ansi ansi;
    ansi.enabled = !a.no_color && is_tty();

    gff::ReadOptions ro;
    ro.strict_labels = a.strict;

    try {
        if (a.cmd == "info") {
            std::vector<std::uint8_t> bytes = gff::read_bytes(a.file);
            gff::Header hdr = gff::read_header(bytes, ro);

            std::cout << ansi.bold() << "File" << ansi.reset() << ": " << a.file << "\n";
            std::cout << ansi.bold() << "Content" << ansi.reset() << ": '" << hdr.content_tag << "'";
            if (!gff::content_from_tag(hdr.content_tag)) std::cout << ansi.dim() << " (unrecognised)" << ansi.reset();
            std::cout << "\n";
            std::cout << ansi.bold() << "Version" << ansi.reset() << ": " << hdr.version << "\n";
            std::cout << ansi.bold() << "File size" << ansi.reset() << ": " << bytes.size() << " bytes\n";
            std::cout << ansi.bold() << "CRC-32" << ansi.reset() << ": "
                      << hex8(gff::crc32_bytes(bytes.data(), bytes.size())) << "\n";
            std::cout << ansi.bold() << "Regions" << ansi.reset() << ":\n";
            print_span(ansi, "structs", hdr.structs, "count");
            print_span(ansi, "fields", hdr.fields, "count");
            print_span(ansi, "labels", hdr.labels, "count");
            print_span(ansi, "field data", hdr.field_data, "bytes");
            print_span(ansi, "field indices", hdr.field_indices, "bytes");
            print_span(ansi, "list indices", hdr.list_indices, "bytes");
            return 0;
        }

        if (a.cmd == "tree") {
            gff::GffDocument doc = gff::read_file(a.file, ro);
            std::cout << ansi.bold() << "GFF tree" << ansi.reset() << ": " << a.file
                      << " " << ansi.gray() << "'" << doc.content_tag() << "' root type="
                      << doc.root().type_id() << ansi.reset() << "\n";
            print_struct(doc.root(), ansi, 0, 0, a.max_depth);
            return 0;
        }

        if (a.cmd == "get") {
            gff::GffDocument doc = gff::read_file(a.file, ro);
            const gff::GffField& f = gff::easy::find_field(doc.root(), a.operand);
            print_field(f, ansi, 0, 0, static_cast<std::size_t>(-1));
            return 0;
        }

        if (a.cmd == "diff") {
            gff::GffDocument lhs = gff::read_file(a.file, ro);
            gff::GffDocument rhs = gff::read_file(a.operand, ro);
            std::size_t n = 0;
            bool same = lhs.compare(rhs, [&](const std::string& line) {
                ++n;
                std::cout << ansi.yellow() << "~ " << ansi.reset() << line << "\n";
            });
            if (same) {
                std::cout << ansi.green() << "identical" << ansi.reset() << "\n";
                return 0;
            }
            std::cout << ansi.red() << n << " difference(s)" << ansi.reset() << "\n";
            return 1;
        }

        if (a.cmd == "roundtrip") {
            std::vector<std::uint8_t> in = gff::read_bytes(a.file);
            gff::GffDocument doc = gff::decode(in, ro);
            gff::WriteOptions wo;
            wo.dedupe_field_data = !a.no_dedupe;
            wo.version = gff::read_header(in, ro).version;
            std::vector<std::uint8_t> out = gff::encode(doc, wo);

            if (in == out) {
                std::cout << ansi.green() << "byte-identical" << ansi.reset() << " (" << out.size() << " bytes)\n";
                return 0;
            }
            auto mm = std::mismatch(in.begin(), in.end(), out.begin(), out.end());
            std::cout << ansi.yellow() << "re-encoded bytes differ" << ansi.reset()
                      << " at offset " << static_cast<std::size_t>(mm.first - in.begin())
                      << " (in " << in.size() << " bytes, out " << out.size() << " bytes)\n";

            // Layout drift is fine as long as the tree survives.
            if (gff::decode(out, ro) == doc) {
                std::cout << ansi.green() << "tree preserved" << ansi.reset() << "\n";
                return 0;
            }
            std::cout << ansi.red() << "tree changed on re-decode" << ansi.reset() << "\n";
            return 1;
        }

        if (a.cmd == "view") {
            gff::GffDocument doc = gff::read_file(a.file, ro);
            return run_view(a, doc);
        }

    } catch (const gff::GffError& e) {
        std::cerr << ansi.red() << "Error" << ansi.reset() << " (" << gff::to_string(e.kind());
        if (e.region() != gff::GffRegion::None) std::cerr << ", " << gff::to_string(e.region());
        std::cerr << "): " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << ansi.red() << "Error" << ansi.reset() << ": " << e.what() << "\n";
        return 1;
    }

    usage();
    return 2;
}
