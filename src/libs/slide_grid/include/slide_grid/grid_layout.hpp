#pragma once

#include <slide_grid/geometry.hpp>
#include <slide_model/types.hpp>
#include <cstddef>
#include <optional>
#include <vector>

namespace slide_grid {

// How assign_block decides whether the target cell is free.
enum class OccupancyCheck {
    // Only another block's origin blocks the cell; the moved block's span is not
    // re-checked. Matches layouts authored before span coverage was enforced.
    OriginOnly,
    // The moved block's whole rectangle (origin + current span) must fit the grid
    // and stay clear of every other block.
    Coverage
};

// Throws std::invalid_argument if either dimension is < 1.
slide_model::GridLayout make_grid_layout(int rows, int columns);

// Block whose origin is the given cell. Span coverage does not count.
std::optional<slide_model::BlockId> cell_occupant(const slide_model::GridLayout& layout, int row, int column);

// Block whose span covers the cell without having its origin there.
std::optional<slide_model::BlockId> covering_block(const slide_model::GridLayout& layout, int row, int column);

bool is_cell_covered(const slide_model::GridLayout& layout, int row, int column);

// Mutators below leave `layout` untouched whenever they return false.

bool assign_block(slide_model::GridLayout& layout, const slide_model::BlockId& block_id,
    int row, int column, OccupancyCheck check = OccupancyCheck::Coverage);

// Throws std::invalid_argument for spans < 1 or a block without a position.
bool set_block_span(slide_model::GridLayout& layout, const slide_model::BlockId& block_id,
    int row_span, int column_span);

// Drops position and span. Returns false if the block had no position.
bool unassign_block(slide_model::GridLayout& layout, const slide_model::BlockId& block_id);

// Never rejects: blocks that no longer fit are clamped, then shrunk, moved to the
// first free cell, or unassigned. Throws std::invalid_argument if a dimension is < 1.
slide_model::GridLayout resize_grid(const slide_model::GridLayout& layout, int rows, int columns);

// Removes entries for ids that are not in `blocks`. Returns how many ids were dropped.
std::size_t prune_blocks(slide_model::GridLayout& layout, const std::vector<slide_model::Block>& blocks);

// First origin, scanning row-major, where a block of this span fits.
std::optional<slide_model::GridPosition> find_free_cell(const slide_model::GridLayout& layout,
    int row_span, int column_span);

// True when every positioned block lies inside the grid and no two overlap.
bool is_consistent(const slide_model::GridLayout& layout);

} // namespace slide_grid
