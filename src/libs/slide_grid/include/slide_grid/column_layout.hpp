#pragma once

#include <slide_model/types.hpp>
#include <vector>

namespace slide_grid {

// Equal widths; the last column absorbs the rounding remainder.
// Throws std::invalid_argument outside layout::min_legacy_columns..max_legacy_columns.
slide_model::ColumnLayout make_column_layout(int column_count);

// Same width rule as make_column_layout. Blocks assigned to a removed column go back to column 0.
void set_column_count(slide_model::ColumnLayout& columns, int column_count);

// The difference is taken from the next column (column 0 for the last one).
// Rejected if the new width leaves 10..90 percent or the neighbour drops below 10.
bool set_column_width(slide_model::ColumnLayout& columns, int index, int percent);

bool assign_to_column(slide_model::ColumnLayout& columns, const slide_model::BlockId& block_id, int column);

// Blocks without an assignment count as column 0.
std::vector<slide_model::BlockId> blocks_in_column(const slide_model::ColumnLayout& columns,
    const std::vector<slide_model::Block>& blocks, int column);

// k-th block of column c lands at (k, c) with a 1x1 span.
slide_model::GridLayout to_grid_layout(const slide_model::ColumnLayout& columns,
    const std::vector<slide_model::Block>& blocks);

} // namespace slide_grid
