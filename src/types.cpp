/*
 * GridPath C++ Core - Common Types
 * Part of gridpath interactive A* pathfinding
 */

#include "gridpath/types.hpp"

namespace gridpath {

std::string to_string(const Cell& cell) {
    return "(" + std::to_string(cell.row) + ", " + std::to_string(cell.col) + ")";
}

const char* to_string(CellState state) {
    switch (state) {
        case CellState::Free:     return "Free";
        case CellState::Obstacle: return "Obstacle";
        case CellState::Start:    return "Start";
        case CellState::Target:   return "Target";
    }
    return "?";
}

const char* to_string(EngineState state) {
    switch (state) {
        case EngineState::Ready:     return "Ready";
        case EngineState::Running:   return "Running";
        case EngineState::Succeeded: return "Succeeded";
        case EngineState::Failed:    return "Failed";
    }
    return "?";
}

const char* to_string(VisitStatus status) {
    switch (status) {
        case VisitStatus::Undiscovered: return "Undiscovered";
        case VisitStatus::Open:         return "Open";
        case VisitStatus::Closed:       return "Closed";
    }
    return "?";
}

}  // namespace gridpath
