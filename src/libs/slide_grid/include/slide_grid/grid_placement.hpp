#pragma once

#include <slide_model/types.hpp>
#include <string>
#include <vector>

namespace slide_grid {

// Grid lines are 1-based and the end line is exclusive, as CSS and LVGL grids expect.
struct PlacedBlock {
    slide_model::BlockId block_id;
    slide_model::BlockKind kind = slide_model::BlockKind::Text;
    int row_start = 1;
    int row_end = 2;
    int column_start = 1;
    int column_end = 2;
};

enum class CellState { Empty, Origin, Covered };

struct PlacedCell {
    int row = 0;
    int column = 0;
    CellState state = CellState::Empty;
    slide_model::BlockId block_id; // origin owner or covering block; empty for Empty
};

struct PlacedGrid {
    int rows = 1;
    int columns = 1;
    std::vector<PlacedBlock> placed_blocks;  // block-list order
    std::vector<PlacedCell> cells;           // row-major
    std::vector<slide_model::BlockId> unassigned;
};

PlacedGrid place_grid(const slide_model::GridLayout& layout, const std::vector<slide_model::Block>& blocks);

} // namespace slide_grid
