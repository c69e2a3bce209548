// Slide grid command-line driver: load a slide, apply layout edits, print the result.
#include <layout_host/editor_session.hpp>
#include <layout_host/logging.hpp>
#include <slide_loaders/json_loader.hpp>
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct Edit {
    std::string op;
    std::vector<std::string> args;
};

const char* const usage =
    "usage: slide_grid_cli <slide.json> [edits...] [--origin-only] [--log-file PATH] [--out PATH]\n"
    "edits (applied in order):\n"
    "  --resize ROWS COLUMNS\n"
    "  --assign BLOCK ROW COLUMN\n"
    "  --span BLOCK ROW_SPAN COLUMN_SPAN\n"
    "  --unassign BLOCK\n"
    "  --remove BLOCK\n"
    "  --group BLOCK GROUP\n"
    "  --split BLOCK GROUP\n";

std::size_t arg_count(const std::string& op) {
    if (op == "--resize") return 2;
    if (op == "--assign" || op == "--span") return 3;
    if (op == "--unassign" || op == "--remove") return 1;
    if (op == "--group" || op == "--split") return 2;
    return 0;
}

bool parse_int(const std::string& s, int& out) {
    try {
        std::size_t used = 0;
        out = std::stoi(s, &used);
        return used == s.size();
    } catch (const std::logic_error&) {
        return false;
    }
}

// Returns false only for malformed arguments; a rejected edit is reported and skipped.
bool apply_edit(layout_host::EditorSession& session, const Edit& e) {
    const auto& a = e.args;
    bool accepted = true;
    if (e.op == "--resize") {
        int rows = 0, columns = 0;
        if (!parse_int(a[0], rows) || !parse_int(a[1], columns)) return false;
        session.resize_grid(rows, columns);
    } else if (e.op == "--assign") {
        int row = 0, column = 0;
        if (!parse_int(a[1], row) || !parse_int(a[2], column)) return false;
        accepted = session.assign(a[0], row, column);
    } else if (e.op == "--span") {
        int row_span = 0, column_span = 0;
        if (!parse_int(a[1], row_span) || !parse_int(a[2], column_span)) return false;
        if (row_span < 1 || column_span < 1) return false;
        accepted = session.set_span(a[0], row_span, column_span);
    } else if (e.op == "--unassign") {
        accepted = session.unassign(a[0]);
    } else if (e.op == "--remove") {
        accepted = session.remove_block(a[0]);
    } else if (e.op == "--group") {
        accepted = session.set_group(a[0], a[1]);
    } else if (e.op == "--split") {
        accepted = session.split_feedback_block(a[0], a[1]);
    }
    if (!accepted) {
        std::string joined;
        for (const auto& s : a)
            joined += " " + s;
        (void)fprintf(stderr, "rejected: %s%s\n", e.op.c_str(), joined.c_str());
    }
    return true;
}

} // namespace

int main(int argc, char* argv[])
{
    std::string slide_path;
    std::string out_path;
    std::string log_path;
    bool origin_only = false;
    std::vector<Edit> edits;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            (void)fputs(usage, stdout);
            return 0;
        }
        if (arg == "--origin-only") {
            origin_only = true;
        } else if (arg == "--out" || arg == "--log-file") {
            if (i + 1 >= argc) {
                (void)fprintf(stderr, "%s needs a path\n%s", arg.c_str(), usage);
                return 2;
            }
            (arg == "--out" ? out_path : log_path) = argv[++i];
        } else if (const std::size_t n = arg_count(arg); n > 0) {
            if (i + static_cast<int>(n) >= argc) {
                (void)fprintf(stderr, "%s needs %zu argument(s)\n%s", arg.c_str(), n, usage);
                return 2;
            }
            Edit e;
            e.op = arg;
            for (std::size_t k = 0; k < n; ++k)
                e.args.push_back(argv[++i]);
            edits.push_back(std::move(e));
        } else if (slide_path.empty() && arg.rfind("--", 0) != 0) {
            slide_path = arg;
        } else {
            (void)fprintf(stderr, "unknown argument: %s\n%s", arg.c_str(), usage);
            return 2;
        }
    }

    if (slide_path.empty()) {
        (void)fputs(usage, stderr);
        return 2;
    }
    if (!log_path.empty() && !layout_host::init_file_logging(log_path))
        (void)fprintf(stderr, "could not open log file %s, logging to console\n", log_path.c_str());

    auto slide = slide_loaders::load_slide_from_json_file(slide_path);
    if (!slide) {
        (void)fprintf(stderr, "failed to load slide from %s\n", slide_path.c_str());
        return 1;
    }

    layout_host::EditorSession session(std::move(*slide));
    if (origin_only) session.set_occupancy_check(slide_grid::OccupancyCheck::OriginOnly);

    for (const auto& e : edits) {
        if (!apply_edit(session, e)) {
            (void)fprintf(stderr, "bad arguments for %s\n%s", e.op.c_str(), usage);
            return 2;
        }
    }

    if (!out_path.empty()) {
        if (!slide_loaders::save_slide_to_json_file(session.slide(), out_path)) {
            (void)fprintf(stderr, "failed to write %s\n", out_path.c_str());
            return 1;
        }
    } else {
        std::cout << slide_loaders::slide_to_json(session.slide()) << '\n';
    }
    std::cout << slide_loaders::connections_to_json(session.connections()) << '\n';
    return 0;
}
