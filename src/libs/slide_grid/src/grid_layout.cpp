#include <slide_grid/grid_layout.hpp>
#include <slide_grid/overlap_validator.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>
#include <string>
#include <unordered_set>

namespace slide_grid {

namespace {

struct ResizeEntry {
    slide_model::BlockId id;
    slide_model::GridPosition original;
    slide_model::GridPosition clamped;
    slide_model::BlockSpan span;
    bool had_span = false;
    bool moved = false;
};

void require_dimensions(int rows, int columns) {
    if (rows < 1 || columns < 1)
        throw std::invalid_argument("grid dimensions must be positive, got "
            + std::to_string(rows) + "x" + std::to_string(columns));
}

void place_entry(slide_model::GridLayout& out, const ResizeEntry& e,
    const slide_model::GridPosition& origin, const slide_model::BlockSpan& span)
{
    out.positions[e.id] = origin;
    if (e.had_span) out.spans[e.id] = span;
}

} // namespace

slide_model::GridLayout make_grid_layout(int rows, int columns) {
    require_dimensions(rows, columns);
    slide_model::GridLayout layout;
    layout.rows = rows;
    layout.columns = columns;
    return layout;
}

std::optional<slide_model::BlockId> cell_occupant(const slide_model::GridLayout& layout, int row, int column) {
    for (const auto& [id, origin] : layout.positions) {
        if (origin.row == row && origin.column == column) return id;
    }
    return std::nullopt;
}

std::optional<slide_model::BlockId> covering_block(const slide_model::GridLayout& layout, int row, int column) {
    for (const auto& [id, origin] : layout.positions) {
        if (origin.row == row && origin.column == column) continue;
        if (make_rect(origin, span_of(layout, id)).contains(row, column)) return id;
    }
    return std::nullopt;
}

bool is_cell_covered(const slide_model::GridLayout& layout, int row, int column) {
    return covering_block(layout, row, column).has_value();
}

bool assign_block(slide_model::GridLayout& layout, const slide_model::BlockId& block_id,
    int row, int column, OccupancyCheck check)
{
    if (row < 0 || column < 0 || row >= layout.rows || column >= layout.columns) {
        spdlog::debug("slide_grid: assign '{}' to ({},{}) outside {}x{} grid",
            block_id, row, column, layout.rows, layout.columns);
        return false;
    }

    if (check == OccupancyCheck::OriginOnly) {
        auto occupant = cell_occupant(layout, row, column);
        if (occupant && *occupant != block_id) {
            spdlog::debug("slide_grid: assign '{}' to ({},{}) rejected, origin of '{}'",
                block_id, row, column, *occupant);
            return false;
        }
    } else {
        const auto span = span_of(layout, block_id);
        if (auto rejection = validate_placement(layout, block_id, row, column, span.row_span, span.column_span)) {
            spdlog::debug("slide_grid: assign '{}' with {}x{} span to ({},{}) rejected, {} {}",
                block_id, span.row_span, span.column_span, row, column,
                reject_reason_name(rejection->reason), rejection->blocker);
            return false;
        }
    }

    layout.positions[block_id] = { row, column };
    return true;
}

bool set_block_span(slide_model::GridLayout& layout, const slide_model::BlockId& block_id,
    int row_span, int column_span)
{
    if (row_span < 1 || column_span < 1)
        throw std::invalid_argument("span must be at least 1x1 for block '" + block_id + "'");
    auto it = layout.positions.find(block_id);
    if (it == layout.positions.end())
        throw std::invalid_argument("cannot set span of unpositioned block '" + block_id + "'");

    const auto& origin = it->second;
    if (auto rejection = validate_placement(layout, block_id, origin.row, origin.column, row_span, column_span)) {
        spdlog::debug("slide_grid: span {}x{} for '{}' in {}x{} grid rejected, {} {}",
            row_span, column_span, block_id, layout.rows, layout.columns,
            reject_reason_name(rejection->reason), rejection->blocker);
        return false;
    }

    layout.spans[block_id] = { row_span, column_span };
    return true;
}

bool unassign_block(slide_model::GridLayout& layout, const slide_model::BlockId& block_id) {
    if (layout.positions.erase(block_id) == 0) return false;
    layout.spans.erase(block_id);
    return true;
}

slide_model::GridLayout resize_grid(const slide_model::GridLayout& layout, int rows, int columns) {
    require_dimensions(rows, columns);

    std::vector<ResizeEntry> entries;
    entries.reserve(layout.positions.size());
    for (const auto& [id, origin] : layout.positions) {
        ResizeEntry e;
        e.id = id;
        e.original = origin;
        e.had_span = layout.spans.count(id) > 0;
        const auto span = span_of(layout, id);

        e.clamped.row = std::min(origin.row, rows - 1);
        e.clamped.column = std::min(origin.column, columns - 1);
        e.span.row_span = std::max(1, std::min(span.row_span, rows - e.clamped.row));
        e.span.column_span = std::max(1, std::min(span.column_span, columns - e.clamped.column));
        e.moved = e.clamped != origin || e.span != span;
        entries.push_back(std::move(e));
    }

    // Untouched blocks claim their cells first, then reading order of the old grid.
    std::stable_sort(entries.begin(), entries.end(), [](const ResizeEntry& a, const ResizeEntry& b) {
        if (a.moved != b.moved) return !a.moved;
        if (a.original.row != b.original.row) return a.original.row < b.original.row;
        return a.original.column < b.original.column;
    });

    slide_model::GridLayout out = make_grid_layout(rows, columns);
    for (const auto& [id, span] : layout.spans) {
        if (layout.positions.count(id) == 0) out.spans[id] = span;
    }

    for (const auto& e : entries) {
        if (!validate_placement(out, e.id, make_rect(e.clamped, e.span))) {
            place_entry(out, e, e.clamped, e.span);
            continue;
        }
        const slide_model::BlockSpan unit;
        if (!validate_placement(out, e.id, make_rect(e.clamped, unit))) {
            place_entry(out, e, e.clamped, unit);
            continue;
        }
        if (auto free_cell = find_free_cell(out, 1, 1)) {
            spdlog::debug("slide_grid: resize moved '{}' to ({},{})", e.id, free_cell->row, free_cell->column);
            place_entry(out, e, *free_cell, unit);
            continue;
        }
        spdlog::debug("slide_grid: resize to {}x{} left no room for '{}'", rows, columns, e.id);
    }

    return out;
}

std::size_t prune_blocks(slide_model::GridLayout& layout, const std::vector<slide_model::Block>& blocks) {
    std::unordered_set<slide_model::BlockId> live;
    for (const auto& b : blocks)
        live.insert(b.id);

    std::unordered_set<slide_model::BlockId> dropped;
    for (auto it = layout.positions.begin(); it != layout.positions.end();) {
        if (live.count(it->first) == 0) {
            dropped.insert(it->first);
            it = layout.positions.erase(it);
        } else {
            ++it;
        }
    }
    for (auto it = layout.spans.begin(); it != layout.spans.end();) {
        if (live.count(it->first) == 0) {
            dropped.insert(it->first);
            it = layout.spans.erase(it);
        } else {
            ++it;
        }
    }
    return dropped.size();
}

std::optional<slide_model::GridPosition> find_free_cell(const slide_model::GridLayout& layout,
    int row_span, int column_span)
{
    if (row_span < 1 || column_span < 1) return std::nullopt;
    for (int r = 0; r <= layout.rows - row_span; ++r) {
        for (int c = 0; c <= layout.columns - column_span; ++c) {
            if (!validate_placement(layout, {}, r, c, row_span, column_span))
                return slide_model::GridPosition{ r, c };
        }
    }
    return std::nullopt;
}

bool is_consistent(const slide_model::GridLayout& layout) {
    if (layout.rows < 1 || layout.columns < 1) return false;
    for (const auto& [id, origin] : layout.positions) {
        if (validate_placement(layout, id, make_rect(origin, span_of(layout, id)))) return false;
    }
    return true;
}

} // namespace slide_grid
