/*
 * GridPath C++ Core - A* Search Engine
 * Part of gridpath interactive A* pathfinding
 *
 * Step-wise A* over a 4-connected unit-cost grid:
 * - Pull-based: each next() pops and expands one frontier cell
 * - Deterministic: fixed neighbor order, f-score ties go to the earliest insertion
 * - Observable: every step reports the visited cell and the frontier changes
 */

#pragma once

#include "types.hpp"
#include "grid.hpp"
#include <functional>
#include <optional>
#include <queue>
#include <vector>

namespace gridpath {

// One frontier pop-and-expand cycle
struct StepEvent {
    std::optional<Cell> visited;       // Empty on the Failed event
    std::vector<Cell> frontier_updates; // Newly admitted or improved, in expansion order
    EngineState state = EngineState::Running;
};

class SearchRun {
public:
    // Throws OutOfBounds or InvalidConfiguration (obstacle endpoint) before any step.
    // The grid is borrowed and must outlive the run unmodified.
    SearchRun(const Grid& grid, const Cell& start, const Cell& target, bool visual = false);
    SearchRun(Grid&&, const Cell&, const Cell&, bool = false) = delete;

    // Perform one step; empty once the terminal event has been returned
    std::optional<StepEvent> next();

    // Drain remaining steps and return the path, or empty if none exists
    std::optional<Path> solve();

    // Start-to-target path; empty unless the run has Succeeded.
    // Throws ReconstructionError if the predecessor chain is broken.
    std::optional<Path> reconstruct_path() const;

    EngineState state() const { return state_; }
    bool is_finished() const {
        return state_ == EngineState::Succeeded || state_ == EngineState::Failed;
    }

    // Advisory only; the engine behaves identically either way
    bool visual() const { return visual_; }

    Cell start() const { return start_; }
    Cell target() const { return target_; }
    const Grid& grid() const { return grid_; }

    VisitStatus status_of(const Cell& cell) const;
    std::optional<int> g_cost(const Cell& cell) const;

    // g + heuristic to target; empty while the cell is unseen
    std::optional<int> f_cost(const Cell& cell) const;

    // Statistics
    int steps() const { return steps_; }
    int nodes_explored() const { return nodes_explored_; }

private:
    StepEvent step();

    void push_open(int idx, int g_score);

    [[noreturn]] void fail_reconstruction(const std::string& reason) const;

    static constexpr int kUnseen = -1;

    const Grid& grid_;
    Cell start_, target_;
    int start_idx_ = 0;
    int target_idx_ = 0;
    bool visual_;
    EngineState state_ = EngineState::Ready;

    // A* data structures
    using PQ = std::priority_queue<AStarNode, std::vector<AStarNode>, std::greater<AStarNode>>;
    PQ open_set_;
    std::vector<int> g_scores_;      // kUnseen until reached
    std::vector<int> parents_;       // Predecessor cell index, -1 for none
    std::vector<uint8_t> closed_;
    uint64_t next_seq_ = 0;

    int steps_ = 0;
    int nodes_explored_ = 0;
};

// Begin a new run between explicit endpoints
SearchRun start_search(const Grid& grid, const Cell& start, const Cell& target,
                       bool visual = false);
SearchRun start_search(Grid&&, const Cell&, const Cell&, bool = false) = delete;

// Begin a new run between the grid's current Start and Target cells
SearchRun start_search(const Grid& grid, bool visual = false);
SearchRun start_search(Grid&&, bool = false) = delete;

// One-shot non-visual solve
std::optional<Path> find_path(const Grid& grid, const Cell& start, const Cell& target);
std::optional<Path> find_path(const Grid& grid);

}  // namespace gridpath
