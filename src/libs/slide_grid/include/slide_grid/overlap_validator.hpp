#pragma once

#include <slide_grid/geometry.hpp>
#include <slide_model/types.hpp>
#include <optional>

namespace slide_grid {

enum class RejectReason {
    OutOfBounds,  // rectangle leaves the grid
    Overlap       // rectangle intersects another positioned block
};

struct Rejection {
    RejectReason reason = RejectReason::OutOfBounds;
    slide_model::BlockId blocker; // set for Overlap
};

const char* reject_reason_name(RejectReason reason);

// First other positioned block (in id order) whose rectangle intersects `rect`.
// `block_id` itself is never compared; pass an empty id to compare against every block.
std::optional<slide_model::BlockId> find_conflict(const slide_model::GridLayout& layout,
    const slide_model::BlockId& block_id, const CellRect& rect);

// Single legality test for a placement of `block_id`: bounds first, then an O(n)
// scan over the other positioned blocks. nullopt means the placement is legal.
// Every mutator in grid_layout.hpp goes through this.
std::optional<Rejection> validate_placement(const slide_model::GridLayout& layout,
    const slide_model::BlockId& block_id, const CellRect& rect);

std::optional<Rejection> validate_placement(const slide_model::GridLayout& layout,
    const slide_model::BlockId& block_id, int row, int column, int row_span, int column_span);

// validate_placement without the reason.
bool check_placement(const slide_model::GridLayout& layout, const slide_model::BlockId& block_id,
    int row, int column, int row_span, int column_span);

bool check_placement(const slide_model::GridLayout& layout, const slide_model::BlockId& block_id,
    const CellRect& rect);

} // namespace slide_grid
