#pragma once

#include <slide_grid/connections.hpp>
#include <slide_grid/grid_layout.hpp>
#include <slide_grid/grid_placement.hpp>
#include <slide_model/types.hpp>
#include <functional>
#include <string>
#include <vector>

namespace layout_host {

// Authoring-side owner of one slide and its current layout snapshot. Every edit is
// applied to a copy of the snapshot and swapped in only when the grid accepts it.
class EditorSession {
public:
    using SlideChangedCallback = std::function<void(const slide_model::Slide&)>;

    explicit EditorSession(slide_model::Slide slide);

    const slide_model::Slide& slide() const { return slide_; }
    const slide_model::GridLayout& layout() const { return slide_.grid; }
    const std::vector<slide_grid::Connection>& connections() const { return connections_; }
    slide_grid::PlacedGrid placement() const;

    void set_occupancy_check(slide_grid::OccupancyCheck check) { occupancy_check_ = check; }
    slide_grid::OccupancyCheck occupancy_check() const { return occupancy_check_; }

    // Called after every accepted edit, e.g. to persist the slide.
    void set_on_slide_changed(SlideChangedCallback callback) { on_slide_changed_ = std::move(callback); }

    bool on_drag_start(const slide_model::BlockId& block_id);
    bool on_drop(int row, int column);
    void cancel_drag();
    bool is_dragging() const { return !dragged_block_id_.empty(); }
    const slide_model::BlockId& dragged_block_id() const { return dragged_block_id_; }

    // Requests are clamped to the authoring range before the grid is resized.
    void resize_grid(int rows, int columns);
    bool assign(const slide_model::BlockId& block_id, int row, int column);
    bool set_span(const slide_model::BlockId& block_id, int row_span, int column_span);
    bool unassign(const slide_model::BlockId& block_id);
    bool remove_block(const slide_model::BlockId& block_id);
    bool set_group(const slide_model::BlockId& block_id, const std::string& group_id);

    // Replaces a feedback-question block with grouped question/image/feedback parts.
    bool split_feedback_block(const slide_model::BlockId& block_id, const std::string& group_id);

private:
    const slide_model::Block* find_block(const slide_model::BlockId& block_id) const;
    void commit(slide_model::GridLayout next);
    void refresh_connections();
    void notify();

    slide_model::Slide slide_;
    std::vector<slide_grid::Connection> connections_;
    slide_grid::OccupancyCheck occupancy_check_ = slide_grid::OccupancyCheck::Coverage;
    slide_model::BlockId dragged_block_id_;
    SlideChangedCallback on_slide_changed_;
};

} // namespace layout_host
