#pragma once

#include <map>
#include <string>
#include <vector>

namespace slide_model {

using BlockId = std::string;

enum class BlockKind { Text, Image, Question, Graph, FeedbackQuestion, AiChat, Unknown };

// Which part of a feedback question a block renders. Split parts carry one of
// Question, Image or Feedback; an unsplit block renders All.
enum class DisplayMode { All, Question, Image, Feedback };

struct Block {
    BlockId id;
    BlockKind kind = BlockKind::Text;
    // Empty = not part of any group.
    std::string group_id;
    DisplayMode display_mode = DisplayMode::All;
};

// Origin (top-left) cell of a placed block.
struct GridPosition {
    int row = 0;
    int column = 0;
};

struct BlockSpan {
    int row_span = 1;
    int column_span = 1;
};

inline bool operator==(const GridPosition& a, const GridPosition& b) {
    return a.row == b.row && a.column == b.column;
}
inline bool operator!=(const GridPosition& a, const GridPosition& b) { return !(a == b); }

inline bool operator==(const BlockSpan& a, const BlockSpan& b) {
    return a.row_span == b.row_span && a.column_span == b.column_span;
}
inline bool operator!=(const BlockSpan& a, const BlockSpan& b) { return !(a == b); }

// Blocks missing from `positions` are unassigned; blocks missing from `spans` are 1x1.
struct GridLayout {
    int rows = 1;
    int columns = 1;
    std::map<BlockId, GridPosition> positions;
    std::map<BlockId, BlockSpan> spans;
};

inline bool operator==(const GridLayout& a, const GridLayout& b) {
    return a.rows == b.rows && a.columns == b.columns
        && a.positions == b.positions && a.spans == b.spans;
}
inline bool operator!=(const GridLayout& a, const GridLayout& b) { return !(a == b); }

// Column-based layout used by slides authored before the grid existed.
struct ColumnLayout {
    int column_count = 1;
    std::vector<int> column_widths{ 100 }; // percentages, sum to 100
    std::map<BlockId, int> block_assignments;
};

struct Slide {
    std::string id;
    std::string title;
    std::vector<Block> blocks;
    GridLayout grid;
    bool has_legacy_columns = false;
    ColumnLayout legacy_columns;
};

const char* block_kind_name(BlockKind kind);
BlockKind block_kind_from_string(const std::string& s);

const char* display_mode_name(DisplayMode mode);
// Unrecognised names map to All.
DisplayMode display_mode_from_string(const std::string& s);

} // namespace slide_model
