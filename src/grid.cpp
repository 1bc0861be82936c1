/*
 * GridPath C++ Core - 2D Grid Implementation
 * Part of gridpath interactive A* pathfinding
 */

#include "gridpath/grid.hpp"
#include "gridpath/log.hpp"
#include <algorithm>
#include <cstdint>
#include <limits>

namespace gridpath {

namespace {

// Default endpoints sit on the row just above the middle, inset up to four
// columns from the left and right edges: (9, 4) and (9, 25) on the 20x30 board.
std::pair<Cell, Cell> computed_defaults(int rows, int cols) {
    if (cols == 1) {
        return {{0, 0}, {rows - 1, 0}};
    }
    int row = std::max(0, rows / 2 - 1);
    int inset = std::min(4, (cols - 2) / 2);
    return {{row, inset}, {row, cols - 1 - inset}};
}

}  // namespace

Grid::Grid(int rows, int cols)
    : Grid(GridConfig{rows, cols, std::nullopt, std::nullopt}) {}

Grid::Grid(const GridConfig& config)
    : rows_(config.rows), cols_(config.cols) {

    if (rows_ <= 0 || cols_ <= 0) {
        throw InvalidDimensions("grid dimensions must be positive, got " +
                                std::to_string(rows_) + "x" + std::to_string(cols_));
    }
    // Start and Target need two distinct cells
    if (static_cast<int64_t>(rows_) * cols_ < 2) {
        throw InvalidDimensions("grid needs at least two cells to hold start and target");
    }
    // Flat indices are int
    if (static_cast<int64_t>(rows_) * cols_ > std::numeric_limits<int>::max()) {
        throw InvalidDimensions("grid of " + std::to_string(rows_) + "x" +
                                std::to_string(cols_) + " cells is too large");
    }

    auto [computed_start, computed_target] = computed_defaults(rows_, cols_);
    default_start_ = config.default_start.value_or(computed_start);
    default_target_ = config.default_target.value_or(computed_target);

    check_bounds(default_start_, "default start");
    check_bounds(default_target_, "default target");
    if (default_start_ == default_target_) {
        throw InvalidState("default start and target must differ, both are " +
                           gridpath::to_string(default_start_));
    }

    // Allocate contiguous cell storage
    cells_.resize(static_cast<size_t>(rows_) * cols_, CellState::Free);
    reset();
}

void Grid::check_bounds(const Cell& cell, const char* what) const {
    if (!in_bounds(cell)) {
        throw OutOfBounds(std::string(what) + ": cell " + gridpath::to_string(cell) +
                          " outside " + std::to_string(rows_) + "x" +
                          std::to_string(cols_) + " grid");
    }
}

CellState Grid::state(const Cell& cell) const {
    check_bounds(cell, "state");
    return cells_[static_cast<size_t>(index(cell))];
}

void Grid::set_cell_state(const Cell& cell, CellState state) {
    check_bounds(cell, "set_cell_state");

    switch (state) {
        case CellState::Start:
            if (cell == start_) return;
            if (cell == target_) {
                logsys::get()->debug("rejected start placement on target {}",
                                     gridpath::to_string(cell));
                throw InvalidState("cannot place start on the target cell " +
                                   gridpath::to_string(cell));
            }
            at(start_) = CellState::Free;
            at(cell) = CellState::Start;
            start_ = cell;
            return;

        case CellState::Target:
            if (cell == target_) return;
            if (cell == start_) {
                logsys::get()->debug("rejected target placement on start {}",
                                     gridpath::to_string(cell));
                throw InvalidState("cannot place target on the start cell " +
                                   gridpath::to_string(cell));
            }
            at(target_) = CellState::Free;
            at(cell) = CellState::Target;
            target_ = cell;
            return;

        case CellState::Free:
        case CellState::Obstacle:
            if (cell == start_ || cell == target_) {
                logsys::get()->debug("rejected {} on endpoint {}", gridpath::to_string(state),
                                     gridpath::to_string(cell));
                throw InvalidState("cell " + gridpath::to_string(cell) +
                                   " holds the " + (cell == start_ ? "start" : "target") +
                                   " role; move the role first");
            }
            at(cell) = state;
            return;
    }
}

bool Grid::toggle_obstacle(const Cell& cell) {
    check_bounds(cell, "toggle_obstacle");
    auto& s = at(cell);
    if (s == CellState::Free) {
        s = CellState::Obstacle;
        return true;
    }
    if (s == CellState::Obstacle) {
        s = CellState::Free;
        return true;
    }
    return false;
}

void Grid::mark_rect_obstacle(const Cell& a, const Cell& b) {
    int r1 = std::min(a.row, b.row);
    int r2 = std::max(a.row, b.row);
    int c1 = std::min(a.col, b.col);
    int c2 = std::max(a.col, b.col);

    // No overlap with the grid
    if (r2 < 0 || r1 >= rows_ || c2 < 0 || c1 >= cols_) {
        return;
    }

    r1 = std::max(r1, 0);
    r2 = std::min(r2, rows_ - 1);
    c1 = std::max(c1, 0);
    c2 = std::min(c2, cols_ - 1);

    for (int row = r1; row <= r2; ++row) {
        for (int col = c1; col <= c2; ++col) {
            auto& s = at({row, col});
            if (s == CellState::Free) {
                s = CellState::Obstacle;
            }
        }
    }
}

void Grid::reset() {
    std::fill(cells_.begin(), cells_.end(), CellState::Free);
    start_ = default_start_;
    target_ = default_target_;
    at(start_) = CellState::Start;
    at(target_) = CellState::Target;
}

std::vector<Cell> Grid::neighbors_of(const Cell& cell) const {
    check_bounds(cell, "neighbors_of");

    std::vector<Cell> result;
    result.reserve(4);
    for (const auto& [drow, dcol] : kNeighbors4) {
        Cell next{cell.row + drow, cell.col + dcol};
        if (!in_bounds(next) || is_obstacle_at(index(next))) {
            continue;
        }
        result.push_back(next);
    }
    return result;
}

int Grid::count_obstacles() const {
    return static_cast<int>(std::count(cells_.begin(), cells_.end(), CellState::Obstacle));
}

std::string Grid::to_string() const {
    std::string out;
    out.reserve(static_cast<size_t>(rows_) * (cols_ + 1));
    for (int row = 0; row < rows_; ++row) {
        for (int col = 0; col < cols_; ++col) {
            switch (cells_[static_cast<size_t>(index({row, col}))]) {
                case CellState::Free:     out.push_back('.'); break;
                case CellState::Obstacle: out.push_back('#'); break;
                case CellState::Start:    out.push_back('S'); break;
                case CellState::Target:   out.push_back('T'); break;
            }
        }
        out.push_back('\n');
    }
    return out;
}

bool Grid::operator==(const Grid& other) const {
    return rows_ == other.rows_ && cols_ == other.cols_ &&
           start_ == other.start_ && target_ == other.target_ &&
           cells_ == other.cells_;
}

}  // namespace gridpath
