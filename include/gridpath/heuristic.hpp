/*
 * GridPath C++ Core - Heuristic and Edge Cost
 * Part of gridpath interactive A* pathfinding
 */

#pragma once

#include "types.hpp"
#include <cstdlib>

namespace gridpath {

// Manhattan distance; admissible and consistent for 4-connected unit-cost moves
inline int heuristic(const Cell& a, const Cell& b) {
    return std::abs(a.row - b.row) + std::abs(a.col - b.col);
}

// Uniform terrain: every orthogonal move costs 1
inline int edge_cost(const Cell& /*a*/, const Cell& /*b*/) {
    return 1;
}

}  // namespace gridpath
