/**
 * @file test_grid_layout.cpp
 * @brief Grid queries and mutations: assignment, spans, resizing, pruning, and
 *        the no-overlap / in-bounds invariants across edit sequences.
 */

#include "test_helpers.hpp"

#include <slide_grid/grid_layout.hpp>
#include <slide_grid/grid_placement.hpp>
#include <slide_grid/overlap_validator.hpp>

#include <catch2/catch.hpp>

#include <limits>
#include <random>
#include <stdexcept>

using namespace slide_grid;
using slide_model::BlockSpan;
using slide_model::GridLayout;
using slide_model::GridPosition;

// =============================================================================
// Construction and queries
// =============================================================================

TEST_CASE("Default layout is an empty 1x1 grid", "[grid_layout][model]") {
    GridLayout layout;
    CHECK(layout.rows == 1);
    CHECK(layout.columns == 1);
    CHECK(layout.positions.empty());
    CHECK(layout.spans.empty());
    CHECK(is_consistent(layout));
}

TEST_CASE("make_grid_layout rejects non-positive dimensions", "[grid_layout][model]") {
    CHECK_THROWS_AS(make_grid_layout(0, 2), std::invalid_argument);
    CHECK_THROWS_AS(make_grid_layout(2, -1), std::invalid_argument);
    CHECK_NOTHROW(make_grid_layout(7, 9));
}

TEST_CASE("cell_occupant only reports origins", "[grid_layout][query]") {
    auto layout = make_grid_layout(2, 2);
    REQUIRE(assign_block(layout, "x", 0, 0));
    REQUIRE(set_block_span(layout, "x", 1, 2));

    auto occupant = cell_occupant(layout, 0, 0);
    REQUIRE(occupant.has_value());
    CHECK(*occupant == "x");
    CHECK_FALSE(cell_occupant(layout, 0, 1).has_value());
}

TEST_CASE("is_cell_covered marks span coverage but not the origin", "[grid_layout][query]") {
    auto layout = make_grid_layout(2, 2);
    REQUIRE(assign_block(layout, "x", 0, 0));
    REQUIRE(set_block_span(layout, "x", 2, 2));

    CHECK_FALSE(is_cell_covered(layout, 0, 0));
    CHECK(is_cell_covered(layout, 0, 1));
    CHECK(is_cell_covered(layout, 1, 0));
    CHECK(is_cell_covered(layout, 1, 1));
    REQUIRE(covering_block(layout, 1, 1).has_value());
    CHECK(*covering_block(layout, 1, 1) == "x");
}

// =============================================================================
// assign_block
// =============================================================================

TEST_CASE("assign_block places a block and keeps its span", "[grid_layout][assign]") {
    auto layout = make_grid_layout(3, 3);
    REQUIRE(assign_block(layout, "a", 0, 0));
    REQUIRE(set_block_span(layout, "a", 1, 2));
    REQUIRE(assign_block(layout, "a", 2, 1));

    CHECK(layout.positions.at("a") == GridPosition{ 2, 1 });
    CHECK(layout.spans.at("a") == BlockSpan{ 1, 2 });
}

TEST_CASE("assign_block rejects a cell that is another block's origin", "[grid_layout][assign]") {
    auto layout = make_grid_layout(2, 2);
    REQUIRE(assign_block(layout, "a", 0, 0));
    const GridLayout before = layout;

    SECTION("coverage check") {
        CHECK_FALSE(assign_block(layout, "b", 0, 0));
        CHECK(layout == before);
    }
    SECTION("origin-only check") {
        CHECK_FALSE(assign_block(layout, "b", 0, 0, OccupancyCheck::OriginOnly));
        CHECK(layout == before);
    }
}

TEST_CASE("assign_block lets a block re-drop on its own origin", "[grid_layout][assign]") {
    auto layout = make_grid_layout(2, 2);
    REQUIRE(assign_block(layout, "a", 1, 1));
    CHECK(assign_block(layout, "a", 1, 1));
    CHECK(assign_block(layout, "a", 1, 1, OccupancyCheck::OriginOnly));
}

TEST_CASE("assign_block rejects cells outside the grid", "[grid_layout][assign]") {
    auto layout = make_grid_layout(2, 2);
    CHECK_FALSE(assign_block(layout, "a", 2, 0));
    CHECK_FALSE(assign_block(layout, "a", 0, -1, OccupancyCheck::OriginOnly));
    CHECK(layout.positions.empty());
}

TEST_CASE("Dropping onto a cell covered by a neighbour's span", "[grid_layout][assign]") {
    auto layout = make_grid_layout(2, 2);
    REQUIRE(assign_block(layout, "x", 0, 0));
    REQUIRE(set_block_span(layout, "x", 1, 2));

    SECTION("is rejected by the coverage check") {
        CHECK_FALSE(assign_block(layout, "y", 0, 1));
        CHECK(layout.positions.count("y") == 0);
        CHECK(is_consistent(layout));
    }
    SECTION("is accepted by the origin-only check, leaving a double occupancy") {
        CHECK(assign_block(layout, "y", 0, 1, OccupancyCheck::OriginOnly));
        CHECK(layout.positions.at("y") == GridPosition{ 0, 1 });
        CHECK_FALSE(is_consistent(layout));
    }
}

TEST_CASE("Coverage check validates the moved block's full rectangle", "[grid_layout][assign]") {
    auto layout = make_grid_layout(2, 3);
    REQUIRE(assign_block(layout, "a", 0, 0));
    REQUIRE(set_block_span(layout, "a", 1, 2));
    REQUIRE(assign_block(layout, "b", 1, 2));

    // 1x2 span would leave the grid from column 2.
    CHECK_FALSE(assign_block(layout, "a", 0, 2));
    // 1x2 span at (1,1) would overlap b.
    CHECK_FALSE(assign_block(layout, "a", 1, 1));
    CHECK(assign_block(layout, "a", 1, 0));
    CHECK(is_consistent(layout));
}

// =============================================================================
// set_block_span
// =============================================================================

TEST_CASE("set_block_span grows a block into free cells", "[grid_layout][span]") {
    auto layout = make_grid_layout(2, 2);
    REQUIRE(assign_block(layout, "x", 0, 0));
    CHECK(set_block_span(layout, "x", 1, 2));
    CHECK(layout.spans.at("x") == BlockSpan{ 1, 2 });
}

TEST_CASE("set_block_span rejects spans leaving the grid", "[grid_layout][span]") {
    auto layout = make_grid_layout(2, 2);
    REQUIRE(assign_block(layout, "x", 1, 1));
    const GridLayout before = layout;
    CHECK_FALSE(set_block_span(layout, "x", 2, 1));
    CHECK_FALSE(set_block_span(layout, "x", 1, 2));
    CHECK(layout == before);
}

TEST_CASE("set_block_span rejects a span overlapping a neighbour", "[grid_layout][span]") {
    auto layout = make_grid_layout(1, 3);
    REQUIRE(assign_block(layout, "a", 0, 1));
    REQUIRE(set_block_span(layout, "a", 1, 2));
    REQUIRE(assign_block(layout, "b", 0, 0));
    const GridLayout before = layout;

    CHECK_FALSE(set_block_span(layout, "b", 1, 2));
    CHECK(layout == before);

    CHECK(set_block_span(layout, "b", 1, 1));
    CHECK(layout.positions == before.positions);
    CHECK(span_of(layout, "b") == BlockSpan{ 1, 1 });
}

TEST_CASE("set_block_span touching a neighbour's edge is legal", "[grid_layout][span]") {
    auto layout = make_grid_layout(2, 4);
    REQUIRE(assign_block(layout, "a", 0, 0));
    REQUIRE(assign_block(layout, "b", 0, 2));
    CHECK(set_block_span(layout, "a", 2, 2));
    CHECK(set_block_span(layout, "b", 2, 2));
    CHECK(is_consistent(layout));
}

TEST_CASE("set_block_span is idempotent", "[grid_layout][span]") {
    auto layout = make_grid_layout(3, 3);
    REQUIRE(assign_block(layout, "a", 0, 0));
    REQUIRE(set_block_span(layout, "a", 2, 3));
    const GridLayout once = layout;
    REQUIRE(set_block_span(layout, "a", 2, 3));
    CHECK(layout == once);
}

TEST_CASE("set_block_span contract violations throw", "[grid_layout][span]") {
    auto layout = make_grid_layout(2, 2);
    CHECK_THROWS_AS(set_block_span(layout, "ghost", 1, 1), std::invalid_argument);
    REQUIRE(assign_block(layout, "a", 0, 0));
    CHECK_THROWS_AS(set_block_span(layout, "a", 0, 1), std::invalid_argument);
}

// =============================================================================
// resize_grid
// =============================================================================

TEST_CASE("resize_grid clamps a far block to the single remaining cell", "[grid_layout][resize]") {
    auto layout = make_grid_layout(4, 4);
    REQUIRE(assign_block(layout, "a", 2, 2));
    REQUIRE(set_block_span(layout, "a", 2, 2));

    GridLayout shrunk = resize_grid(layout, 1, 1);
    CHECK(shrunk.rows == 1);
    CHECK(shrunk.columns == 1);
    CHECK(shrunk.positions.at("a") == GridPosition{ 0, 0 });
    CHECK(shrunk.spans.at("a") == BlockSpan{ 1, 1 });
}

TEST_CASE("resize_grid truncates spans crossing the new edge", "[grid_layout][resize]") {
    auto layout = make_grid_layout(3, 3);
    REQUIRE(assign_block(layout, "a", 0, 0));
    REQUIRE(set_block_span(layout, "a", 3, 3));

    GridLayout shrunk = resize_grid(layout, 2, 3);
    CHECK(shrunk.positions.at("a") == GridPosition{ 0, 0 });
    CHECK(shrunk.spans.at("a") == BlockSpan{ 2, 3 });
    CHECK(is_consistent(shrunk));
}

TEST_CASE("resize_grid growing keeps every block unchanged", "[grid_layout][resize]") {
    auto layout = make_grid_layout(2, 2);
    REQUIRE(assign_block(layout, "a", 1, 1));
    REQUIRE(assign_block(layout, "b", 0, 0));
    GridLayout grown = resize_grid(layout, 5, 5);
    CHECK(grown.positions == layout.positions);
    CHECK(grown.spans == layout.spans);
}

TEST_CASE("resize_grid resolves collisions created by clamping", "[grid_layout][resize]") {
    auto layout = make_grid_layout(3, 3);
    REQUIRE(assign_block(layout, "stay", 1, 1));
    REQUIRE(assign_block(layout, "far", 2, 2));

    GridLayout shrunk = resize_grid(layout, 2, 2);
    CHECK(shrunk.positions.at("stay") == GridPosition{ 1, 1 });
    // "far" clamps onto (1,1), which "stay" kept, so it moves to the first free cell.
    CHECK(shrunk.positions.at("far") == GridPosition{ 0, 0 });
    CHECK(is_consistent(shrunk));
}

TEST_CASE("resize_grid unassigns blocks when the grid is full", "[grid_layout][resize]") {
    auto layout = make_grid_layout(2, 2);
    REQUIRE(assign_block(layout, "a", 0, 0));
    REQUIRE(assign_block(layout, "b", 0, 1));
    REQUIRE(assign_block(layout, "c", 1, 0));
    REQUIRE(set_block_span(layout, "c", 1, 2));

    GridLayout shrunk = resize_grid(layout, 1, 1);
    CHECK(shrunk.positions.size() == 1);
    CHECK(shrunk.positions.at("a") == GridPosition{ 0, 0 });
    CHECK(shrunk.spans.count("c") == 0);
    CHECK(is_consistent(shrunk));
}

TEST_CASE("resize_grid rejects non-positive dimensions", "[grid_layout][resize]") {
    GridLayout layout;
    CHECK_THROWS_AS(resize_grid(layout, 0, 1), std::invalid_argument);
}

// =============================================================================
// Pruning and free-cell search
// =============================================================================

TEST_CASE("prune_blocks drops entries for deleted blocks", "[grid_layout][prune]") {
    auto layout = make_grid_layout(2, 2);
    REQUIRE(assign_block(layout, "a", 0, 0));
    REQUIRE(assign_block(layout, "gone", 1, 1));
    layout.spans["orphan"] = { 1, 1 };

    CHECK(prune_blocks(layout, test_helpers::make_blocks({ "a" })) == 2);
    CHECK(layout.positions.size() == 1);
    CHECK(layout.positions.count("a") == 1);
    CHECK(layout.spans.empty());
}

TEST_CASE("find_free_cell scans in reading order", "[grid_layout][free_cell]") {
    auto layout = make_grid_layout(2, 3);
    REQUIRE(assign_block(layout, "a", 0, 0));
    REQUIRE(set_block_span(layout, "a", 1, 2));

    auto cell = find_free_cell(layout, 1, 1);
    REQUIRE(cell.has_value());
    CHECK(*cell == GridPosition{ 0, 2 });

    auto wide = find_free_cell(layout, 1, 3);
    REQUIRE(wide.has_value());
    CHECK(*wide == GridPosition{ 1, 0 });

    CHECK(find_free_cell(layout, 2, 1).has_value());
    CHECK_FALSE(find_free_cell(layout, 3, 1).has_value());
}

// =============================================================================
// Invariants across random edit sequences
// =============================================================================

TEST_CASE("Accepted edits never break bounds or overlap", "[grid_layout][invariant]") {
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> op_dist(0, 3);
    std::uniform_int_distribution<int> small(0, 5);
    std::uniform_int_distribution<int> dim(1, 5);
    const std::vector<std::string> ids = { "a", "b", "c", "d", "e", "f" };
    std::uniform_int_distribution<std::size_t> id_dist(0, ids.size() - 1);

    GridLayout layout = make_grid_layout(3, 3);
    for (int step = 0; step < 2000; ++step) {
        const std::string& id = ids[id_dist(rng)];
        switch (op_dist(rng)) {
        case 0:
            assign_block(layout, id, small(rng), small(rng));
            break;
        case 1:
            if (layout.positions.count(id) > 0) set_block_span(layout, id, dim(rng), dim(rng));
            break;
        case 2:
            layout = resize_grid(layout, dim(rng), dim(rng));
            break;
        default:
            unassign_block(layout, id);
            break;
        }
        REQUIRE(is_consistent(layout));
    }
}

TEST_CASE("Mutators accept exactly what check_placement accepts", "[grid_layout][invariant]") {
    std::mt19937 rng(4321);
    std::uniform_int_distribution<int> op_dist(0, 2);
    std::uniform_int_distribution<int> cell(-1, 5);
    std::uniform_int_distribution<int> dim(1, 6);
    const std::vector<std::string> ids = { "a", "b", "c", "d", "e" };
    std::uniform_int_distribution<std::size_t> id_dist(0, ids.size() - 1);

    GridLayout layout = make_grid_layout(4, 4);
    for (int step = 0; step < 2000; ++step) {
        const std::string& id = ids[id_dist(rng)];
        const GridLayout before = layout;
        switch (op_dist(rng)) {
        case 0: {
            const int row = cell(rng);
            const int column = cell(rng);
            const auto span = span_of(layout, id);
            const bool legal = check_placement(layout, id, row, column, span.row_span, span.column_span);
            REQUIRE(assign_block(layout, id, row, column) == legal);
            break;
        }
        case 1: {
            auto it = layout.positions.find(id);
            if (it == layout.positions.end()) break;
            const int rows = dim(rng);
            const int columns = dim(rng);
            const bool legal = check_placement(layout, id, it->second.row, it->second.column, rows, columns);
            REQUIRE(set_block_span(layout, id, rows, columns) == legal);
            break;
        }
        default:
            unassign_block(layout, id);
            break;
        }
        if (layout != before) REQUIRE(is_consistent(layout));
    }
}

TEST_CASE("Oversized spans are rejected without touching the layout", "[grid_layout][span]") {
    constexpr int max = std::numeric_limits<int>::max();
    auto layout = make_grid_layout(10, 10);
    REQUIRE(assign_block(layout, "a", 5, 0));
    REQUIRE(assign_block(layout, "b", 0, 0));
    const GridLayout before = layout;

    CHECK_FALSE(set_block_span(layout, "a", max, 1));
    CHECK_FALSE(set_block_span(layout, "a", 1, max));
    CHECK_FALSE(set_block_span(layout, "a", max, max));
    CHECK(layout == before);

    CHECK_FALSE(assign_block(layout, "c", max, 0));
    CHECK_FALSE(assign_block(layout, "c", 0, max));
    CHECK(layout == before);
}

TEST_CASE("Layouts carrying extreme values are inconsistent", "[grid_layout][invariant]") {
    constexpr int max = std::numeric_limits<int>::max();

    GridLayout huge_span = make_grid_layout(10, 10);
    huge_span.positions["a"] = { 5, 0 };
    huge_span.spans["a"] = { max, 1 };
    CHECK_FALSE(is_consistent(huge_span));

    GridLayout huge_origin = make_grid_layout(10, 10);
    huge_origin.positions["a"] = { max, max };
    CHECK_FALSE(is_consistent(huge_origin));

    // The render plan clips lines to the grid instead of overflowing.
    auto placed = place_grid(huge_span, test_helpers::make_blocks({ "a" }));
    REQUIRE(placed.placed_blocks.size() == 1);
    CHECK(placed.placed_blocks[0].row_start == 6);
    CHECK(placed.placed_blocks[0].row_end == 11);

    CHECK_FALSE(find_free_cell(make_grid_layout(3, 3), max, 1).has_value());
}

TEST_CASE("Shrinking any valid layout by one row keeps it consistent", "[grid_layout][invariant]") {
    std::mt19937 rng(99);
    std::uniform_int_distribution<int> cell(0, 4);
    std::uniform_int_distribution<int> span(1, 3);

    for (int trial = 0; trial < 200; ++trial) {
        GridLayout layout = make_grid_layout(5, 5);
        for (int k = 0; k < 8; ++k) {
            const std::string id = "b" + std::to_string(k);
            if (assign_block(layout, id, cell(rng), cell(rng)))
                set_block_span(layout, id, span(rng), span(rng));
        }
        REQUIRE(is_consistent(layout));
        for (int rows = layout.rows - 1; rows >= 1; --rows) {
            GridLayout shrunk = resize_grid(layout, rows, layout.columns);
            REQUIRE(is_consistent(shrunk));
            layout = shrunk;
        }
    }
}
