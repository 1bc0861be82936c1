/*
 * GridPath C++ Core - 2D Grid
 * Part of gridpath interactive A* pathfinding
 *
 * Fixed-size rectangular grid of cell states with contiguous row-major storage.
 * Holds exactly one Start and one Target cell at all times.
 */

#pragma once

#include "types.hpp"
#include <string>
#include <vector>

namespace gridpath {

// Neighbor direction: drow, dcol
struct Neighbor {
    int drow;
    int dcol;
};

// Expansion order for 4-connectivity: up, down, left, right.
// Search step sequences depend on this order.
inline constexpr Neighbor kNeighbors4[4] = {
    {-1, 0},  // Up
    {1, 0},   // Down
    {0, -1},  // Left
    {0, 1},   // Right
};

class Grid {
public:
    Grid(int rows, int cols);
    explicit Grid(const GridConfig& config);

    // Cell access
    inline bool in_bounds(const Cell& cell) const {
        return cell.row >= 0 && cell.row < rows_ && cell.col >= 0 && cell.col < cols_;
    }

    inline bool is_obstacle_at(int index) const {
        return cells_[static_cast<size_t>(index)] == CellState::Obstacle;
    }

    inline int index(const Cell& cell) const {
        return cell.row * cols_ + cell.col;
    }

    inline Cell cell_at(int index) const {
        return {index / cols_, index % cols_};
    }

    CellState state(const Cell& cell) const;

    // Editing. Throws OutOfBounds / InvalidState and leaves the grid unchanged on error.
    void set_cell_state(const Cell& cell, CellState state);

    // Free <-> Obstacle; returns false (no change) on the Start or Target cell
    bool toggle_obstacle(const Cell& cell);

    // Inclusive rectangle, clamped to the grid; Start and Target are skipped
    void mark_rect_obstacle(const Cell& a, const Cell& b);

    // All cells Free except the default Start and Target
    void reset();

    // Traversable orthogonal neighbors in kNeighbors4 order
    std::vector<Cell> neighbors_of(const Cell& cell) const;

    // Accessors
    int rows() const { return rows_; }
    int cols() const { return cols_; }
    size_t total_cells() const { return cells_.size(); }
    Cell start() const { return start_; }
    Cell target() const { return target_; }
    Cell default_start() const { return default_start_; }
    Cell default_target() const { return default_target_; }

    // Statistics
    int count_obstacles() const;

    // One line per row: '.' free, '#' obstacle, 'S' start, 'T' target
    std::string to_string() const;

    bool operator==(const Grid& other) const;
    bool operator!=(const Grid& other) const { return !(*this == other); }

private:
    inline CellState& at(const Cell& cell) {
        return cells_[static_cast<size_t>(index(cell))];
    }

    void check_bounds(const Cell& cell, const char* what) const;

    std::vector<CellState> cells_;  // Flat array, row-major
    int rows_, cols_;
    Cell start_, target_;
    Cell default_start_, default_target_;
};

}  // namespace gridpath
