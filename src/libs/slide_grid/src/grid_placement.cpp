#include <slide_grid/grid_placement.hpp>
#include <slide_grid/geometry.hpp>
#include <slide_grid/grid_layout.hpp>
#include <algorithm>
#include <cstdint>

namespace slide_grid {

namespace {

// 1-based line at `index`, clipped to the lines of a track with `count` cells.
int grid_line(std::int64_t index, int count) {
    return static_cast<int>(std::clamp<std::int64_t>(index, 1, static_cast<std::int64_t>(count) + 1));
}

} // namespace

PlacedGrid place_grid(const slide_model::GridLayout& layout, const std::vector<slide_model::Block>& blocks)
{
    PlacedGrid out;
    out.rows = layout.rows;
    out.columns = layout.columns;

    for (const auto& b : blocks) {
        auto it = layout.positions.find(b.id);
        if (it == layout.positions.end()) {
            out.unassigned.push_back(b.id);
            continue;
        }
        const auto span = span_of(layout, b.id);
        PlacedBlock pb;
        pb.block_id = b.id;
        pb.kind = b.kind;
        const std::int64_t row_start = static_cast<std::int64_t>(it->second.row) + 1;
        const std::int64_t column_start = static_cast<std::int64_t>(it->second.column) + 1;
        pb.row_start = grid_line(row_start, layout.rows);
        pb.row_end = grid_line(row_start + span.row_span, layout.rows);
        pb.column_start = grid_line(column_start, layout.columns);
        pb.column_end = grid_line(column_start + span.column_span, layout.columns);
        out.placed_blocks.push_back(std::move(pb));
    }

    out.cells.reserve(static_cast<std::size_t>(layout.rows) * static_cast<std::size_t>(layout.columns));
    for (int r = 0; r < layout.rows; ++r) {
        for (int c = 0; c < layout.columns; ++c) {
            PlacedCell cell;
            cell.row = r;
            cell.column = c;
            // An origin wins over coverage if an unchecked assignment stacked the two.
            if (auto owner = cell_occupant(layout, r, c)) {
                cell.state = CellState::Origin;
                cell.block_id = *owner;
            } else if (auto cover = covering_block(layout, r, c)) {
                cell.state = CellState::Covered;
                cell.block_id = *cover;
            }
            out.cells.push_back(std::move(cell));
        }
    }

    return out;
}

} // namespace slide_grid
