#include <slide_grid/column_layout.hpp>
#include <slide_grid/grid_layout.hpp>
#include <slide_grid/layout_constants.hpp>
#include <algorithm>
#include <stdexcept>
#include <string>

namespace slide_grid {

namespace {

std::vector<int> equal_widths(int column_count) {
    const int equal = layout::total_column_width_percent / column_count;
    std::vector<int> widths(static_cast<std::size_t>(column_count), equal);
    widths.back() = layout::total_column_width_percent - equal * (column_count - 1);
    return widths;
}

bool width_in_range(int percent) {
    return percent >= layout::min_column_width_percent && percent <= layout::max_column_width_percent;
}

} // namespace

slide_model::ColumnLayout make_column_layout(int column_count) {
    slide_model::ColumnLayout columns;
    set_column_count(columns, column_count);
    return columns;
}

void set_column_count(slide_model::ColumnLayout& columns, int column_count) {
    if (column_count < layout::min_legacy_columns || column_count > layout::max_legacy_columns)
        throw std::invalid_argument("column count out of range: " + std::to_string(column_count));

    columns.column_count = column_count;
    columns.column_widths = equal_widths(column_count);
    for (auto& [id, column] : columns.block_assignments) {
        if (column >= column_count) column = 0;
    }
}

bool set_column_width(slide_model::ColumnLayout& columns, int index, int percent) {
    const int count = static_cast<int>(columns.column_widths.size());
    if (count < 2 || index < 0 || index >= count) return false;
    if (!width_in_range(percent)) return false;

    const auto i = static_cast<std::size_t>(index);
    const int diff = percent - columns.column_widths[i];
    const auto adjust = static_cast<std::size_t>(index < count - 1 ? index + 1 : 0);
    const int adjusted = columns.column_widths[adjust] - diff;
    if (adjusted < layout::min_column_width_percent) return false;

    columns.column_widths[i] = percent;
    columns.column_widths[adjust] = adjusted;
    return true;
}

bool assign_to_column(slide_model::ColumnLayout& columns, const slide_model::BlockId& block_id, int column) {
    if (column < 0 || column >= columns.column_count) return false;
    columns.block_assignments[block_id] = column;
    return true;
}

std::vector<slide_model::BlockId> blocks_in_column(const slide_model::ColumnLayout& columns,
    const std::vector<slide_model::Block>& blocks, int column)
{
    std::vector<slide_model::BlockId> out;
    for (const auto& b : blocks) {
        auto it = columns.block_assignments.find(b.id);
        const int assigned = it == columns.block_assignments.end() ? 0 : it->second;
        if (assigned == column) out.push_back(b.id);
    }
    return out;
}

slide_model::GridLayout to_grid_layout(const slide_model::ColumnLayout& columns,
    const std::vector<slide_model::Block>& blocks)
{
    const int column_count = std::max(1, columns.column_count);
    std::vector<std::vector<slide_model::BlockId>> per_column;
    std::size_t tallest = 1;
    for (int c = 0; c < column_count; ++c) {
        per_column.push_back(blocks_in_column(columns, blocks, c));
        tallest = std::max(tallest, per_column.back().size());
    }

    slide_model::GridLayout grid = make_grid_layout(static_cast<int>(tallest), column_count);
    for (int c = 0; c < column_count; ++c) {
        const auto& ids = per_column[static_cast<std::size_t>(c)];
        for (std::size_t k = 0; k < ids.size(); ++k)
            grid.positions[ids[k]] = { static_cast<int>(k), c };
    }
    return grid;
}

} // namespace slide_grid
