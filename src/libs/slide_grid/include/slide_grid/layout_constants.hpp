#pragma once

namespace slide_grid {

// Shared layout constants (used by the grid engine, the editor session and the loaders).

namespace layout {

// A new slide starts as a single cell with nothing placed.
constexpr int default_grid_rows = 1;
constexpr int default_grid_columns = 1;

// Range offered by the authoring UI. The engine itself accepts any positive size;
// only the editor session clamps resize requests to this range.
constexpr int min_authoring_dimension = 1;
constexpr int max_authoring_dimension = 5;

// Overlay colour for span highlights and group link lines.
constexpr const char* span_connection_color = "#9333ea";
constexpr const char* group_connection_color = "#9333ea";

// Legacy column layout.
constexpr int min_legacy_columns = 1;
constexpr int max_legacy_columns = 4;
constexpr int min_column_width_percent = 10;
constexpr int max_column_width_percent = 90;
constexpr int total_column_width_percent = 100;

// Suffixes used when a feedback-question block is split into grouped parts.
constexpr const char* split_source_suffix = "-split";
constexpr const char* split_question_suffix = "-question";
constexpr const char* split_image_suffix = "-image";
constexpr const char* split_feedback_suffix = "-feedback";

} // namespace layout

} // namespace slide_grid
