// tests/test_grid.cpp
#include <doctest/doctest.h>

#include "gridpath/grid.hpp"

#include <algorithm>
#include <limits>

using namespace gridpath;

namespace gridpath_grid_test {

int count_state(const Grid& g, CellState s) {
    int n = 0;
    for (int r = 0; r < g.rows(); ++r)
        for (int c = 0; c < g.cols(); ++c)
            if (g.state({r, c}) == s) ++n;
    return n;
}

} // namespace gridpath_grid_test

using gridpath_grid_test::count_state;

TEST_CASE("Grid/CreateRejectsBadDimensions") {
    CHECK_THROWS_AS(Grid(0, 5), InvalidDimensions);
    CHECK_THROWS_AS(Grid(5, 0), InvalidDimensions);
    CHECK_THROWS_AS(Grid(-3, 4), InvalidDimensions);
    CHECK_THROWS_AS(Grid(1, 1), InvalidDimensions);
}

TEST_CASE("Grid/CreateRejectsOversizedGrid") {
    // Cell count above INT_MAX; rejected before any allocation
    CHECK_THROWS_AS(Grid(65536, 65536), InvalidDimensions);
    CHECK_THROWS_AS(Grid(std::numeric_limits<int>::max(), 2), InvalidDimensions);
}

TEST_CASE("Grid/DefaultBoardEndpoints") {
    Grid g(GridConfig{});
    CHECK(g.rows() == 20);
    CHECK(g.cols() == 30);
    CHECK(g.start() == Cell{9, 4});
    CHECK(g.target() == Cell{9, 25});
    CHECK(g.state({9, 4}) == CellState::Start);
    CHECK(g.state({9, 25}) == CellState::Target);
    CHECK(count_state(g, CellState::Free) == 20 * 30 - 2);
    CHECK(g.count_obstacles() == 0);
}

TEST_CASE("Grid/SmallGridsHaveDistinctEndpoints") {
    for (int rows = 1; rows <= 6; ++rows) {
        for (int cols = 1; cols <= 6; ++cols) {
            if (rows * cols < 2) continue;
            Grid g(rows, cols);
            CAPTURE(rows);
            CAPTURE(cols);
            CHECK(g.in_bounds(g.start()));
            CHECK(g.in_bounds(g.target()));
            CHECK(g.start() != g.target());
            CHECK(count_state(g, CellState::Start) == 1);
            CHECK(count_state(g, CellState::Target) == 1);
        }
    }
}

TEST_CASE("Grid/ConfigEndpoints") {
    GridConfig cfg;
    cfg.rows = 4;
    cfg.cols = 4;
    cfg.default_start = Cell{0, 0};
    cfg.default_target = Cell{3, 3};
    Grid g(cfg);
    CHECK(g.start() == Cell{0, 0});
    CHECK(g.target() == Cell{3, 3});

    cfg.default_target = Cell{4, 0};
    CHECK_THROWS_AS(Grid(cfg), OutOfBounds);

    cfg.default_target = Cell{0, 0};
    CHECK_THROWS_AS(Grid(cfg), InvalidState);
}

TEST_CASE("Grid/SetCellStateBounds") {
    Grid g(3, 3);
    CHECK_THROWS_AS(g.set_cell_state({3, 0}, CellState::Obstacle), OutOfBounds);
    CHECK_THROWS_AS(g.set_cell_state({0, -1}, CellState::Obstacle), OutOfBounds);
    CHECK_THROWS_AS(g.state({-1, 0}), OutOfBounds);
    CHECK(g.count_obstacles() == 0);
}

TEST_CASE("Grid/MovingStartClearsPreviousHolder") {
    Grid g(5, 5);
    Cell old_start = g.start();
    g.set_cell_state({4, 4}, CellState::Start);
    CHECK(g.start() == Cell{4, 4});
    CHECK(g.state(old_start) == CellState::Free);
    CHECK(count_state(g, CellState::Start) == 1);

    Cell old_target = g.target();
    g.set_cell_state({0, 0}, CellState::Target);
    CHECK(g.target() == Cell{0, 0});
    CHECK(g.state(old_target) == CellState::Free);
    CHECK(count_state(g, CellState::Target) == 1);
}

TEST_CASE("Grid/StartOverObstacleReplacesIt") {
    Grid g(5, 5);
    g.set_cell_state({2, 2}, CellState::Obstacle);
    g.set_cell_state({2, 2}, CellState::Start);
    CHECK(g.state({2, 2}) == CellState::Start);
    CHECK(g.count_obstacles() == 0);
}

TEST_CASE("Grid/RoleConflictIsRejectedUnchanged") {
    Grid g(5, 5);
    Grid before = g;

    CHECK_THROWS_AS(g.set_cell_state(g.target(), CellState::Start), InvalidState);
    CHECK(g == before);

    CHECK_THROWS_AS(g.set_cell_state(g.start(), CellState::Target), InvalidState);
    CHECK(g == before);

    // Overwriting an endpoint would leave its role unheld
    CHECK_THROWS_AS(g.set_cell_state(g.start(), CellState::Obstacle), InvalidState);
    CHECK_THROWS_AS(g.set_cell_state(g.target(), CellState::Free), InvalidState);
    CHECK(g == before);
}

TEST_CASE("Grid/SameRoleIsNoop") {
    Grid g(5, 5);
    Grid before = g;
    g.set_cell_state(g.start(), CellState::Start);
    g.set_cell_state(g.target(), CellState::Target);
    CHECK(g == before);
}

TEST_CASE("Grid/ToggleObstacle") {
    Grid g(3, 4);
    CHECK(g.toggle_obstacle({2, 0}));
    CHECK(g.state({2, 0}) == CellState::Obstacle);
    CHECK(g.toggle_obstacle({2, 0}));
    CHECK(g.state({2, 0}) == CellState::Free);

    CHECK_FALSE(g.toggle_obstacle(g.start()));
    CHECK(g.state(g.start()) == CellState::Start);
    CHECK_FALSE(g.toggle_obstacle(g.target()));

    CHECK_THROWS_AS(g.toggle_obstacle({3, 0}), OutOfBounds);
}

TEST_CASE("Grid/MarkRectSkipsEndpointsAndClamps") {
    Grid g(4, 6);
    g.mark_rect_obstacle({-5, -5}, {10, 10});
    CHECK(g.count_obstacles() == 4 * 6 - 2);
    CHECK(g.state(g.start()) == CellState::Start);
    CHECK(g.state(g.target()) == CellState::Target);
}

TEST_CASE("Grid/MarkRectOutsideIsNoop") {
    Grid g(5, 5);
    Grid before = g;

    g.mark_rect_obstacle({10, 10}, {12, 12});
    CHECK(g == before);
    g.mark_rect_obstacle({-9, 1}, {-7, 3});
    CHECK(g == before);
    g.mark_rect_obstacle({1, 5}, {3, 9});
    CHECK(g == before);
    CHECK(g.count_obstacles() == 0);
}

TEST_CASE("Grid/MarkRectClipsToIntersection") {
    Grid g(5, 5);
    // Rows -3..0, cols 3..7 overlap the grid only at (0,3) and (0,4)
    g.mark_rect_obstacle({-3, 3}, {0, 7});
    CHECK(g.count_obstacles() == 2);
    CHECK(g.state({0, 3}) == CellState::Obstacle);
    CHECK(g.state({0, 4}) == CellState::Obstacle);
    CHECK(g.state({1, 4}) == CellState::Free);
}

TEST_CASE("Grid/NeighborCounts") {
    Grid g(5, 5);
    CHECK(g.neighbors_of({0, 0}).size() == 2u);
    CHECK(g.neighbors_of({4, 4}).size() == 2u);
    CHECK(g.neighbors_of({0, 2}).size() == 3u);
    CHECK(g.neighbors_of({2, 4}).size() == 3u);
    CHECK(g.neighbors_of({2, 2}).size() == 4u);
    CHECK_THROWS_AS(g.neighbors_of({5, 5}), OutOfBounds);
}

TEST_CASE("Grid/NeighborOrderUpDownLeftRight") {
    Grid g(3, 3);
    auto n = g.neighbors_of({1, 1});
    REQUIRE(n.size() == 4u);
    CHECK(n[0] == Cell{0, 1});
    CHECK(n[1] == Cell{2, 1});
    CHECK(n[2] == Cell{1, 0});
    CHECK(n[3] == Cell{1, 2});
}

TEST_CASE("Grid/NeighborsSkipObstacles") {
    Grid g(3, 3);
    g.set_cell_state({0, 1}, CellState::Obstacle);
    g.set_cell_state({1, 2}, CellState::Obstacle);
    auto n = g.neighbors_of({1, 1});
    REQUIRE(n.size() == 2u);
    CHECK(n[0] == Cell{2, 1});
    CHECK(n[1] == Cell{1, 0});
}

TEST_CASE("Grid/ResetIsIdempotent") {
    Grid g(6, 7);
    Grid fresh = g;
    g.mark_rect_obstacle({1, 1}, {3, 3});
    g.set_cell_state({5, 6}, CellState::Start);
    g.set_cell_state({0, 0}, CellState::Target);

    g.reset();
    Grid once = g;
    g.reset();
    CHECK(g == once);
    CHECK(g == fresh);
    CHECK(g.rows() == 6);
    CHECK(g.cols() == 7);
}

TEST_CASE("Grid/ToString") {
    GridConfig cfg;
    cfg.rows = 2;
    cfg.cols = 3;
    cfg.default_start = Cell{0, 0};
    cfg.default_target = Cell{1, 2};
    Grid g(cfg);
    g.set_cell_state({0, 1}, CellState::Obstacle);
    CHECK(g.to_string() == "S#.\n..T\n");
}
