#include <slide_grid/overlap_validator.hpp>

namespace slide_grid {

const char* reject_reason_name(RejectReason reason) {
    switch (reason) {
    case RejectReason::OutOfBounds: return "out of bounds";
    case RejectReason::Overlap: return "overlap";
    }
    return "out of bounds";
}

std::optional<slide_model::BlockId> find_conflict(const slide_model::GridLayout& layout,
    const slide_model::BlockId& block_id, const CellRect& rect)
{
    for (const auto& [other_id, origin] : layout.positions) {
        if (other_id == block_id) continue;
        if (rects_overlap(rect, make_rect(origin, span_of(layout, other_id))))
            return other_id;
    }
    return std::nullopt;
}

std::optional<Rejection> validate_placement(const slide_model::GridLayout& layout,
    const slide_model::BlockId& block_id, const CellRect& rect)
{
    if (!fits_in_grid(layout, rect)) return Rejection{ RejectReason::OutOfBounds, {} };
    if (auto blocker = find_conflict(layout, block_id, rect))
        return Rejection{ RejectReason::Overlap, *blocker };
    return std::nullopt;
}

std::optional<Rejection> validate_placement(const slide_model::GridLayout& layout,
    const slide_model::BlockId& block_id, int row, int column, int row_span, int column_span)
{
    return validate_placement(layout, block_id, make_rect(row, column, row_span, column_span));
}

bool check_placement(const slide_model::GridLayout& layout, const slide_model::BlockId& block_id,
    const CellRect& rect)
{
    return !validate_placement(layout, block_id, rect).has_value();
}

bool check_placement(const slide_model::GridLayout& layout, const slide_model::BlockId& block_id,
    int row, int column, int row_span, int column_span)
{
    return !validate_placement(layout, block_id, row, column, row_span, column_span).has_value();
}

} // namespace slide_grid
