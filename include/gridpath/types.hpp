/*
 * GridPath C++ Core - Common Types
 * Part of gridpath interactive A* pathfinding
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace gridpath {

// Grid coordinate (row, col); a value, never owned by the grid
struct Cell {
    int row = 0;
    int col = 0;

    bool operator==(const Cell& other) const {
        return row == other.row && col == other.col;
    }
    bool operator!=(const Cell& other) const { return !(*this == other); }
    bool operator<(const Cell& other) const {
        return row != other.row ? row < other.row : col < other.col;
    }
};

using Path = std::vector<Cell>;

// Grid cell state
enum class CellState : uint8_t {
    Free = 0,
    Obstacle = 1,
    Start = 2,
    Target = 3,
};

// Search run lifecycle
enum class EngineState : uint8_t {
    Ready = 0,
    Running = 1,
    Succeeded = 2,
    Failed = 3,
};

// Per-run view of a cell, used by renderers to colour the search
enum class VisitStatus : uint8_t {
    Undiscovered = 0,
    Open = 1,
    Closed = 2,
};

// A* node for priority queue
struct AStarNode {
    int f_score;
    int g_score;
    uint64_t seq;  // Insertion order, breaks f_score ties
    int idx;       // Flat cell index

    // Comparison for min-heap (lower f_score first, then earliest inserted)
    bool operator>(const AStarNode& other) const {
        if (f_score != other.f_score) return f_score > other.f_score;
        return seq > other.seq;
    }
};

// Grid configuration (defaults match the interactive board)
struct GridConfig {
    int rows = 20;
    int cols = 30;
    std::optional<Cell> default_start;   // Computed from size when unset
    std::optional<Cell> default_target;
};

// Recoverable errors: the rejected operation leaves all state unchanged
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class InvalidDimensions : public Error {
public:
    using Error::Error;
};

class OutOfBounds : public Error {
public:
    using Error::Error;
};

// Start/Target role placement conflict
class InvalidState : public Error {
public:
    using Error::Error;
};

// Obstructed start or target at search start
class InvalidConfiguration : public Error {
public:
    using Error::Error;
};

// Broken predecessor chain; an engine defect, not a user error
class ReconstructionError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

std::string to_string(const Cell& cell);
const char* to_string(CellState state);
const char* to_string(EngineState state);
const char* to_string(VisitStatus status);

}  // namespace gridpath

namespace std {

template <>
struct hash<gridpath::Cell> {
    size_t operator()(const gridpath::Cell& cell) const noexcept {
        return std::hash<int>()(cell.row) ^ (std::hash<int>()(cell.col) << 16);
    }
};

}  // namespace std
