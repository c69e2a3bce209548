#pragma once

#include <slide_grid/connections.hpp>
#include <slide_model/types.hpp>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace slide_loaders {

// Layout object: { gridRows, gridColumns, blockPositions, blockSpans }.
std::optional<slide_model::GridLayout> load_grid_layout_from_json(std::istream& in);

// Slide object: { id, title, blocks: [{ id, type, groupId }], layout }.
std::optional<slide_model::Slide> load_slide_from_json(std::istream& in);
std::optional<slide_model::Slide> load_slide_from_json_file(const std::string& path);

std::string grid_layout_to_json(const slide_model::GridLayout& layout, int indent = -1);
std::string slide_to_json(const slide_model::Slide& slide, int indent = 2);
std::string connections_to_json(const std::vector<slide_grid::Connection>& connections, int indent = 2);

bool save_slide_to_json_file(const slide_model::Slide& slide, const std::string& path);

} // namespace slide_loaders
