#include <slide_loaders/json_loader.hpp>
#include <slide_grid/column_layout.hpp>
#include <slide_grid/layout_constants.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <fstream>
#include <limits>

namespace slide_loaders {

namespace {

// Integer that fits an int; JSON integers arrive as 64-bit and are never narrowed.
bool int_value(const nlohmann::json& v, int& out) {
    if (v.is_number_unsigned()) {
        const auto u = v.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) return false;
        out = static_cast<int>(u);
        return true;
    }
    if (!v.is_number_integer()) return false;
    const auto i = v.get<std::int64_t>();
    if (i < std::numeric_limits<int>::min() || i > std::numeric_limits<int>::max()) return false;
    out = static_cast<int>(i);
    return true;
}

bool read_int(const nlohmann::json& j, const char* key, int& out) {
    if (!j.contains(key)) return true;
    return int_value(j[key], out);
}

std::optional<slide_model::GridLayout> parse_grid_layout(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;

    slide_model::GridLayout g;
    g.rows = slide_grid::layout::default_grid_rows;
    g.columns = slide_grid::layout::default_grid_columns;
    if (!read_int(j, "gridRows", g.rows) || !read_int(j, "gridColumns", g.columns)) return std::nullopt;
    if (g.rows < 1 || g.columns < 1) return std::nullopt;

    if (j.contains("blockPositions")) {
        const auto& positions = j["blockPositions"];
        if (!positions.is_object()) return std::nullopt;
        for (const auto& [id, p] : positions.items()) {
            if (id.empty() || !p.is_object()) return std::nullopt;
            slide_model::GridPosition pos;
            if (!read_int(p, "row", pos.row) || !read_int(p, "column", pos.column)) return std::nullopt;
            if (pos.row < 0 || pos.column < 0) return std::nullopt;
            g.positions[id] = pos;
        }
    }

    if (j.contains("blockSpans")) {
        const auto& spans = j["blockSpans"];
        if (!spans.is_object()) return std::nullopt;
        for (const auto& [id, s] : spans.items()) {
            if (id.empty() || !s.is_object()) return std::nullopt;
            slide_model::BlockSpan span;
            if (!read_int(s, "rowSpan", span.row_span) || !read_int(s, "columnSpan", span.column_span))
                return std::nullopt;
            if (span.row_span < 1 || span.column_span < 1) return std::nullopt;
            g.spans[id] = span;
        }
    }

    return g;
}

// Legacy fields live beside the grid fields in the same layout object.
bool parse_column_layout(const nlohmann::json& j, slide_model::ColumnLayout& out) {
    int count = slide_grid::layout::min_legacy_columns;
    if (!read_int(j, "columnCount", count)) return false;
    if (count < slide_grid::layout::min_legacy_columns || count > slide_grid::layout::max_legacy_columns)
        return false;
    out = slide_grid::make_column_layout(count);

    if (j.contains("columnWidths")) {
        if (!j["columnWidths"].is_array()) return false;
        out.column_widths.clear();
        for (const auto& w : j["columnWidths"]) {
            if (!w.is_number()) return false;
            const double width = w.get<double>();
            if (!(width >= 0.0 && width <= slide_grid::layout::total_column_width_percent)) return false;
            out.column_widths.push_back(static_cast<int>(width));
        }
    }
    if (j.contains("blockAssignments")) {
        if (!j["blockAssignments"].is_object()) return false;
        for (const auto& [id, column] : j["blockAssignments"].items()) {
            int index = 0;
            if (!int_value(column, index) || index < 0) return false;
            out.block_assignments[id] = index;
        }
    }
    return true;
}

std::optional<slide_model::Slide> parse_slide(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    if (!j.contains("blocks") || !j["blocks"].is_array()) return std::nullopt;

    slide_model::Slide slide;
    slide.id = j.contains("id") && j["id"].is_string() ? j["id"].get<std::string>() : "";
    slide.title = j.contains("title") && j["title"].is_string() ? j["title"].get<std::string>() : "";

    for (const auto& b : j["blocks"]) {
        if (!b.is_object() || !b.contains("id") || !b["id"].is_string()) return std::nullopt;
        slide_model::Block block;
        block.id = b["id"].get<std::string>();
        if (block.id.empty()) return std::nullopt;
        block.kind = b.contains("type") && b["type"].is_string()
            ? slide_model::block_kind_from_string(b["type"].get<std::string>())
            : slide_model::BlockKind::Text;
        block.group_id = b.contains("groupId") && b["groupId"].is_string() ? b["groupId"].get<std::string>() : "";
        if (b.contains("displayMode") && b["displayMode"].is_string())
            block.display_mode = slide_model::display_mode_from_string(b["displayMode"].get<std::string>());
        slide.blocks.push_back(std::move(block));
    }

    if (j.contains("layout") && !j["layout"].is_null()) {
        auto grid = parse_grid_layout(j["layout"]);
        if (!grid) return std::nullopt;
        slide.grid = std::move(*grid);
        if (j["layout"].contains("columnCount")) {
            if (!parse_column_layout(j["layout"], slide.legacy_columns)) return std::nullopt;
            slide.has_legacy_columns = true;
        }
    }

    return slide;
}

nlohmann::json grid_layout_json(const slide_model::GridLayout& layout) {
    nlohmann::json j;
    j["gridRows"] = layout.rows;
    j["gridColumns"] = layout.columns;
    j["blockPositions"] = nlohmann::json::object();
    for (const auto& [id, p] : layout.positions)
        j["blockPositions"][id] = { { "row", p.row }, { "column", p.column } };
    j["blockSpans"] = nlohmann::json::object();
    for (const auto& [id, s] : layout.spans)
        j["blockSpans"][id] = { { "rowSpan", s.row_span }, { "columnSpan", s.column_span } };
    return j;
}

nlohmann::json slide_json(const slide_model::Slide& slide) {
    nlohmann::json j;
    j["id"] = slide.id;
    j["title"] = slide.title;
    j["blocks"] = nlohmann::json::array();
    for (const auto& b : slide.blocks) {
        nlohmann::json block = { { "id", b.id }, { "type", slide_model::block_kind_name(b.kind) } };
        if (!b.group_id.empty()) block["groupId"] = b.group_id;
        if (b.display_mode != slide_model::DisplayMode::All)
            block["displayMode"] = slide_model::display_mode_name(b.display_mode);
        j["blocks"].push_back(std::move(block));
    }
    nlohmann::json layout = grid_layout_json(slide.grid);
    if (slide.has_legacy_columns) {
        layout["columnCount"] = slide.legacy_columns.column_count;
        layout["columnWidths"] = slide.legacy_columns.column_widths;
        layout["blockAssignments"] = nlohmann::json::object();
        for (const auto& [id, column] : slide.legacy_columns.block_assignments)
            layout["blockAssignments"][id] = column;
    }
    j["layout"] = std::move(layout);
    return j;
}

} // namespace

std::optional<slide_model::GridLayout> load_grid_layout_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_grid_layout(j);
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

std::optional<slide_model::Slide> load_slide_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_slide(j);
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

std::optional<slide_model::Slide> load_slide_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return std::nullopt;
    return load_slide_from_json(f);
}

std::string grid_layout_to_json(const slide_model::GridLayout& layout, int indent) {
    return grid_layout_json(layout).dump(indent);
}

std::string slide_to_json(const slide_model::Slide& slide, int indent) {
    return slide_json(slide).dump(indent);
}

std::string connections_to_json(const std::vector<slide_grid::Connection>& connections, int indent) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& c : connections) {
        j.push_back({ { "from", c.from }, { "to", c.to },
            { "kind", slide_grid::connection_kind_name(c.kind) }, { "color", c.color } });
    }
    return j.dump(indent);
}

bool save_slide_to_json_file(const slide_model::Slide& slide, const std::string& path) {
    std::ofstream f(path);
    if (!f) return false;
    f << slide_to_json(slide) << '\n';
    return static_cast<bool>(f);
}

} // namespace slide_loaders
