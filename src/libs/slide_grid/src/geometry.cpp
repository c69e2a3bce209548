#include <slide_grid/geometry.hpp>
#include <algorithm>
#include <cstdint>
#include <limits>

namespace slide_grid {

namespace {

// Last cell covered by `span` cells starting at `start`, saturated to the int range.
int last_cell(int start, int span) {
    const std::int64_t last = static_cast<std::int64_t>(start) + span - 1;
    return static_cast<int>(std::clamp<std::int64_t>(last,
        std::numeric_limits<int>::min(), std::numeric_limits<int>::max()));
}

} // namespace

CellRect make_rect(int row, int column, int row_span, int column_span) {
    CellRect r;
    r.top = row;
    r.left = column;
    r.bottom = last_cell(row, row_span);
    r.right = last_cell(column, column_span);
    return r;
}

CellRect make_rect(const slide_model::GridPosition& origin, const slide_model::BlockSpan& span) {
    return make_rect(origin.row, origin.column, span.row_span, span.column_span);
}

slide_model::BlockSpan span_of(const slide_model::GridLayout& layout, const slide_model::BlockId& block_id) {
    auto it = layout.spans.find(block_id);
    if (it == layout.spans.end()) return {};
    return it->second;
}

std::optional<CellRect> block_rect(const slide_model::GridLayout& layout, const slide_model::BlockId& block_id) {
    auto it = layout.positions.find(block_id);
    if (it == layout.positions.end()) return std::nullopt;
    return make_rect(it->second, span_of(layout, block_id));
}

bool rects_overlap(const CellRect& a, const CellRect& b) {
    return a.left <= b.right && a.right >= b.left && a.top <= b.bottom && a.bottom >= b.top;
}

bool fits_in_grid(const slide_model::GridLayout& layout, const CellRect& rect) {
    if (rect.top < 0 || rect.left < 0) return false;
    if (rect.bottom < rect.top || rect.right < rect.left) return false;
    return rect.bottom < layout.rows && rect.right < layout.columns;
}

} // namespace slide_grid
