#pragma once

#include <slide_model/types.hpp>
#include <optional>

namespace slide_grid {

// Rectangle of grid cells, inclusive on all four edges.
struct CellRect {
    int top = 0;
    int left = 0;
    int bottom = 0;
    int right = 0;

    bool contains(int row, int column) const {
        return row >= top && row <= bottom && column >= left && column <= right;
    }
};

inline bool operator==(const CellRect& a, const CellRect& b) {
    return a.top == b.top && a.left == b.left && a.bottom == b.bottom && a.right == b.right;
}

// Edges past the int range saturate, so an oversized span yields a rectangle that
// fits_in_grid rejects instead of wrapping around.
CellRect make_rect(int row, int column, int row_span, int column_span);
CellRect make_rect(const slide_model::GridPosition& origin, const slide_model::BlockSpan& span);

// Explicit span of the block, or the implicit 1x1.
slide_model::BlockSpan span_of(const slide_model::GridLayout& layout, const slide_model::BlockId& block_id);

// Occupied rectangle of a positioned block; nullopt when the block is unassigned.
std::optional<CellRect> block_rect(const slide_model::GridLayout& layout, const slide_model::BlockId& block_id);

// Cells are integer coordinates, so two rectangles that merely share an edge line
// never share a cell and do not overlap.
bool rects_overlap(const CellRect& a, const CellRect& b);

bool fits_in_grid(const slide_model::GridLayout& layout, const CellRect& rect);

} // namespace slide_grid
