/*
 * GridPath C++ Core - A* Search Engine Implementation
 * Part of gridpath interactive A* pathfinding
 */

#include "gridpath/pathfinder.hpp"
#include "gridpath/heuristic.hpp"
#include "gridpath/log.hpp"
#include <algorithm>

namespace gridpath {

SearchRun::SearchRun(const Grid& grid, const Cell& start, const Cell& target, bool visual)
    : grid_(grid), start_(start), target_(target), visual_(visual) {

    for (const auto& [cell, role] : {std::pair{start, "start"}, std::pair{target, "target"}}) {
        if (!grid_.in_bounds(cell)) {
            throw OutOfBounds(std::string("search ") + role + " " + to_string(cell) +
                              " outside " + std::to_string(grid_.rows()) + "x" +
                              std::to_string(grid_.cols()) + " grid");
        }
        // Obstacles are never traversable, endpoints included
        if (grid_.is_obstacle_at(grid_.index(cell))) {
            throw InvalidConfiguration(std::string("search ") + role + " " +
                                       to_string(cell) + " is an obstacle");
        }
    }

    start_idx_ = grid_.index(start_);
    target_idx_ = grid_.index(target_);

    size_t total = grid_.total_cells();
    g_scores_.assign(total, kUnseen);
    parents_.assign(total, -1);
    closed_.assign(total, 0);

    // Ready: the frontier holds only the start cell
    push_open(start_idx_, 0);

    logsys::get()->debug("search {} -> {} on {}x{} grid (visual={})", to_string(start_),
                         to_string(target_), grid_.rows(), grid_.cols(), visual_);
}

void SearchRun::push_open(int idx, int g_score) {
    g_scores_[idx] = g_score;
    int f = g_score + heuristic(grid_.cell_at(idx), target_);
    open_set_.push(AStarNode{f, g_score, next_seq_++, idx});
}

std::optional<StepEvent> SearchRun::next() {
    if (is_finished()) {
        return std::nullopt;
    }
    state_ = EngineState::Running;
    StepEvent event = step();
    steps_++;
    return event;
}

StepEvent SearchRun::step() {
    StepEvent event;

    // Discard entries superseded by a cheaper re-insertion or already closed
    while (!open_set_.empty()) {
        const AStarNode& top = open_set_.top();
        if (!closed_[top.idx] && top.g_score == g_scores_[top.idx]) {
            break;
        }
        open_set_.pop();
    }

    if (open_set_.empty()) {
        state_ = EngineState::Failed;
        event.state = state_;
        logsys::get()->info("no path {} -> {} after {} steps, {} cells explored",
                            to_string(start_), to_string(target_), steps_ + 1,
                            nodes_explored_);
        return event;
    }

    AStarNode current = open_set_.top();
    open_set_.pop();

    closed_[current.idx] = 1;
    nodes_explored_++;

    Cell current_cell = grid_.cell_at(current.idx);
    event.visited = current_cell;

    // Goal check
    if (current.idx == target_idx_) {
        state_ = EngineState::Succeeded;
        event.state = state_;
        logsys::get()->info("path {} -> {} found, cost {}, {} steps, {} cells explored",
                            to_string(start_), to_string(target_), current.g_score,
                            steps_ + 1, nodes_explored_);
        return event;
    }

    // Explore neighbors
    for (const Cell& neighbor : grid_.neighbors_of(current_cell)) {
        int nidx = grid_.index(neighbor);
        if (closed_[nidx]) {
            continue;
        }

        int new_g = current.g_score + edge_cost(current_cell, neighbor);
        if (g_scores_[nidx] == kUnseen || new_g < g_scores_[nidx]) {
            parents_[nidx] = current.idx;
            push_open(nidx, new_g);
            event.frontier_updates.push_back(neighbor);
        }
    }

    event.state = state_;
    return event;
}

std::optional<Path> SearchRun::solve() {
    while (next()) {
    }
    return reconstruct_path();
}

std::optional<Path> SearchRun::reconstruct_path() const {
    if (state_ != EngineState::Succeeded) {
        return std::nullopt;
    }

    // Build path from target to start
    Path path;
    int idx = target_idx_;
    while (idx >= 0) {
        if (path.size() >= grid_.total_cells()) {
            fail_reconstruction("predecessor cycle");
        }
        if (!closed_[idx]) {
            fail_reconstruction("predecessor " + to_string(grid_.cell_at(idx)) +
                                " was never expanded");
        }
        path.push_back(grid_.cell_at(idx));
        if (idx == start_idx_) {
            break;
        }
        idx = parents_[idx];
    }

    if (path.empty() || path.back() != start_) {
        fail_reconstruction("chain does not reach start " + to_string(start_));
    }

    std::reverse(path.begin(), path.end());
    return path;
}

void SearchRun::fail_reconstruction(const std::string& reason) const {
    logsys::get()->critical("path reconstruction {} -> {} failed: {}", to_string(start_),
                            to_string(target_), reason);
    throw ReconstructionError("path reconstruction failed: " + reason);
}

VisitStatus SearchRun::status_of(const Cell& cell) const {
    if (!grid_.in_bounds(cell)) {
        throw OutOfBounds("status_of: cell " + to_string(cell) + " outside grid");
    }
    int idx = grid_.index(cell);
    if (closed_[idx]) return VisitStatus::Closed;
    if (g_scores_[idx] != kUnseen) return VisitStatus::Open;
    return VisitStatus::Undiscovered;
}

std::optional<int> SearchRun::g_cost(const Cell& cell) const {
    if (!grid_.in_bounds(cell)) {
        throw OutOfBounds("g_cost: cell " + to_string(cell) + " outside grid");
    }
    int g = g_scores_[grid_.index(cell)];
    if (g == kUnseen) return std::nullopt;
    return g;
}

std::optional<int> SearchRun::f_cost(const Cell& cell) const {
    std::optional<int> g = g_cost(cell);
    if (!g) return std::nullopt;
    return *g + heuristic(cell, target_);
}

SearchRun start_search(const Grid& grid, const Cell& start, const Cell& target, bool visual) {
    return SearchRun(grid, start, target, visual);
}

SearchRun start_search(const Grid& grid, bool visual) {
    return SearchRun(grid, grid.start(), grid.target(), visual);
}

std::optional<Path> find_path(const Grid& grid, const Cell& start, const Cell& target) {
    return SearchRun(grid, start, target).solve();
}

std::optional<Path> find_path(const Grid& grid) {
    return SearchRun(grid, grid.start(), grid.target()).solve();
}

}  // namespace gridpath
