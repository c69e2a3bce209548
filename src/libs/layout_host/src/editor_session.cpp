#include <layout_host/editor_session.hpp>
#include <layout_host/logging.hpp>
#include <slide_grid/column_layout.hpp>
#include <slide_grid/layout_constants.hpp>
#include <algorithm>
#include <utility>

namespace layout_host {

namespace {

int clamp_dimension(int value) {
    return std::clamp(value, slide_grid::layout::min_authoring_dimension,
        slide_grid::layout::max_authoring_dimension);
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

EditorSession::EditorSession(slide_model::Slide slide)
    : slide_(std::move(slide))
{
    auto log = session_logger();

    if (slide_.has_legacy_columns && slide_.grid.positions.empty() && !slide_.blocks.empty()) {
        slide_.grid = slide_grid::to_grid_layout(slide_.legacy_columns, slide_.blocks);
        log->info("slide '{}': migrated {}-column layout to a {}x{} grid",
            slide_.id, slide_.legacy_columns.column_count, slide_.grid.rows, slide_.grid.columns);
    }

    const std::size_t pruned = slide_grid::prune_blocks(slide_.grid, slide_.blocks);
    if (pruned > 0) log->info("slide '{}': pruned {} stale layout entries", slide_.id, pruned);
    if (!slide_grid::is_consistent(slide_.grid))
        log->warn("slide '{}': stored layout has overlapping or out-of-bounds blocks", slide_.id);

    refresh_connections();
}

slide_grid::PlacedGrid EditorSession::placement() const {
    return slide_grid::place_grid(slide_.grid, slide_.blocks);
}

bool EditorSession::on_drag_start(const slide_model::BlockId& block_id) {
    if (!find_block(block_id)) {
        session_logger()->warn("drag start on unknown block '{}'", block_id);
        return false;
    }
    dragged_block_id_ = block_id;
    return true;
}

bool EditorSession::on_drop(int row, int column) {
    if (dragged_block_id_.empty()) {
        session_logger()->warn("drop at ({},{}) without an active drag", row, column);
        return false;
    }
    const slide_model::BlockId block_id = std::move(dragged_block_id_);
    dragged_block_id_.clear();
    return assign(block_id, row, column);
}

void EditorSession::cancel_drag() {
    dragged_block_id_.clear();
}

void EditorSession::resize_grid(int rows, int columns) {
    const int r = clamp_dimension(rows);
    const int c = clamp_dimension(columns);
    slide_model::GridLayout next = slide_grid::resize_grid(slide_.grid, r, c);
    const std::size_t lost = slide_.grid.positions.size() - next.positions.size();
    session_logger()->info("grid resized {}x{} -> {}x{}", slide_.grid.rows, slide_.grid.columns, r, c);
    if (lost > 0) session_logger()->warn("resize to {}x{} unassigned {} block(s)", r, c, lost);
    commit(std::move(next));
}

bool EditorSession::assign(const slide_model::BlockId& block_id, int row, int column) {
    if (!find_block(block_id)) {
        session_logger()->warn("assign of unknown block '{}'", block_id);
        return false;
    }
    slide_model::GridLayout next = slide_.grid;
    if (!slide_grid::assign_block(next, block_id, row, column, occupancy_check_)) {
        session_logger()->info("drop of '{}' on ({},{}) rejected", block_id, row, column);
        return false;
    }
    session_logger()->info("'{}' placed at ({},{})", block_id, row, column);
    commit(std::move(next));
    return true;
}

bool EditorSession::set_span(const slide_model::BlockId& block_id, int row_span, int column_span) {
    if (slide_.grid.positions.count(block_id) == 0) {
        session_logger()->warn("span change for unplaced block '{}'", block_id);
        return false;
    }
    slide_model::GridLayout next = slide_.grid;
    if (!slide_grid::set_block_span(next, block_id, row_span, column_span)) {
        session_logger()->info("span {}x{} for '{}' rejected", row_span, column_span, block_id);
        return false;
    }
    commit(std::move(next));
    return true;
}

bool EditorSession::unassign(const slide_model::BlockId& block_id) {
    slide_model::GridLayout next = slide_.grid;
    if (!slide_grid::unassign_block(next, block_id)) return false;
    commit(std::move(next));
    return true;
}

bool EditorSession::remove_block(const slide_model::BlockId& block_id) {
    auto it = std::find_if(slide_.blocks.begin(), slide_.blocks.end(),
        [&](const slide_model::Block& b) { return b.id == block_id; });
    if (it == slide_.blocks.end()) return false;

    slide_.blocks.erase(it);
    slide_.legacy_columns.block_assignments.erase(block_id);
    if (block_id == dragged_block_id_) dragged_block_id_.clear();

    slide_model::GridLayout next = slide_.grid;
    slide_grid::prune_blocks(next, slide_.blocks);
    session_logger()->info("block '{}' removed", block_id);
    commit(std::move(next));
    return true;
}

bool EditorSession::set_group(const slide_model::BlockId& block_id, const std::string& group_id) {
    auto it = std::find_if(slide_.blocks.begin(), slide_.blocks.end(),
        [&](const slide_model::Block& b) { return b.id == block_id; });
    if (it == slide_.blocks.end()) return false;

    it->group_id = group_id;
    refresh_connections();
    notify();
    return true;
}

bool EditorSession::split_feedback_block(const slide_model::BlockId& block_id, const std::string& group_id) {
    auto it = std::find_if(slide_.blocks.begin(), slide_.blocks.end(),
        [&](const slide_model::Block& b) { return b.id == block_id; });
    if (it == slide_.blocks.end() || it->kind != slide_model::BlockKind::FeedbackQuestion) return false;
    if (it->display_mode != slide_model::DisplayMode::All || group_id.empty()) return false;

    std::string base = block_id;
    if (ends_with(base, slide_grid::layout::split_source_suffix))
        base.resize(base.size() - std::string(slide_grid::layout::split_source_suffix).size());

    const std::vector<slide_model::BlockId> part_ids = {
        base + slide_grid::layout::split_question_suffix,
        base + slide_grid::layout::split_image_suffix,
        base + slide_grid::layout::split_feedback_suffix,
    };
    for (const auto& id : part_ids) {
        if (id != block_id && find_block(id)) {
            session_logger()->warn("split of '{}' would duplicate block '{}'", block_id, id);
            return false;
        }
    }

    slide_model::GridLayout next = slide_.grid;
    auto origin = next.positions.find(block_id);
    const bool was_placed = origin != next.positions.end();
    const slide_model::GridPosition old_origin = was_placed ? origin->second : slide_model::GridPosition{};
    auto old_span = next.spans.find(block_id);
    const bool had_span = old_span != next.spans.end();
    const slide_model::BlockSpan span = had_span ? old_span->second : slide_model::BlockSpan{};
    next.positions.erase(block_id);
    next.spans.erase(block_id);

    // The question part takes over the original rectangle, which is free again, and
    // the other parts take free cells. An unplaced source leaves every part unplaced.
    if (was_placed) {
        next.positions[part_ids[0]] = old_origin;
        if (had_span) next.spans[part_ids[0]] = span;
        for (std::size_t i = 1; i < part_ids.size(); ++i) {
            if (auto cell = slide_grid::find_free_cell(next, 1, 1))
                next.positions[part_ids[i]] = *cell;
        }
    }

    const slide_model::DisplayMode modes[] = {
        slide_model::DisplayMode::Question,
        slide_model::DisplayMode::Image,
        slide_model::DisplayMode::Feedback,
    };
    std::vector<slide_model::Block> parts;
    for (std::size_t i = 0; i < part_ids.size(); ++i) {
        slide_model::Block part;
        part.id = part_ids[i];
        part.kind = slide_model::BlockKind::FeedbackQuestion;
        part.group_id = group_id;
        part.display_mode = modes[i];
        parts.push_back(std::move(part));
    }
    it = slide_.blocks.erase(it);
    slide_.blocks.insert(it, parts.begin(), parts.end());
    slide_.legacy_columns.block_assignments.erase(block_id);

    session_logger()->info("block '{}' split into group '{}'", block_id, group_id);
    commit(std::move(next));
    return true;
}

const slide_model::Block* EditorSession::find_block(const slide_model::BlockId& block_id) const {
    for (const auto& b : slide_.blocks) {
        if (b.id == block_id) return &b;
    }
    return nullptr;
}

void EditorSession::commit(slide_model::GridLayout next) {
    slide_.grid = std::move(next);
    refresh_connections();
    notify();
}

void EditorSession::refresh_connections() {
    connections_ = slide_grid::derive_connections(slide_.grid, slide_.blocks);
}

void EditorSession::notify() {
    if (on_slide_changed_) on_slide_changed_(slide_);
}

} // namespace layout_host
