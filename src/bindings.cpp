/*
 * GridPath C++ Core - nanobind Python bindings
 * Part of gridpath interactive A* pathfinding
 */

#include "gridpath/grid.hpp"
#include "gridpath/heuristic.hpp"
#include "gridpath/log.hpp"
#include "gridpath/pathfinder.hpp"
#include "gridpath/types.hpp"
#include <nanobind/nanobind.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

namespace nb = nanobind;
using namespace nb::literals;
using namespace gridpath;

NB_MODULE(gridpath_cpp, m) {
    m.doc() = "C++ A* core for interactive grid pathfinding";

    // Error taxonomy; base registered first so subclasses take precedence
    nb::exception<Error> base_error(m, "GridPathError", PyExc_RuntimeError);
    nb::exception<InvalidDimensions>(m, "InvalidDimensions", base_error);
    nb::exception<OutOfBounds>(m, "OutOfBounds", base_error);
    nb::exception<InvalidState>(m, "InvalidState", base_error);
    nb::exception<InvalidConfiguration>(m, "InvalidConfiguration", base_error);
    nb::exception<ReconstructionError>(m, "ReconstructionError", PyExc_AssertionError);

    nb::enum_<CellState>(m, "CellState")
        .value("Free", CellState::Free)
        .value("Obstacle", CellState::Obstacle)
        .value("Start", CellState::Start)
        .value("Target", CellState::Target);

    nb::enum_<EngineState>(m, "EngineState")
        .value("Ready", EngineState::Ready)
        .value("Running", EngineState::Running)
        .value("Succeeded", EngineState::Succeeded)
        .value("Failed", EngineState::Failed);

    nb::enum_<VisitStatus>(m, "VisitStatus")
        .value("Undiscovered", VisitStatus::Undiscovered)
        .value("Open", VisitStatus::Open)
        .value("Closed", VisitStatus::Closed);

    // Cell struct
    nb::class_<Cell>(m, "Cell")
        .def(nb::init<>())
        .def("__init__", [](Cell* self, int row, int col) { new (self) Cell{row, col}; },
             "row"_a, "col"_a)
        .def_rw("row", &Cell::row)
        .def_rw("col", &Cell::col)
        .def("__eq__", [](const Cell& a, const Cell& b) { return a == b; })
        .def("__ne__", [](const Cell& a, const Cell& b) { return a != b; })
        .def("__lt__", [](const Cell& a, const Cell& b) { return a < b; })
        .def("__hash__", [](const Cell& c) { return std::hash<Cell>()(c); })
        .def("__repr__", [](const Cell& c) { return "Cell" + to_string(c); });

    // GridConfig struct
    nb::class_<GridConfig>(m, "GridConfig")
        .def(nb::init<>())
        .def_rw("rows", &GridConfig::rows)
        .def_rw("cols", &GridConfig::cols)
        .def_rw("default_start", &GridConfig::default_start)
        .def_rw("default_target", &GridConfig::default_target);

    // Grid class
    nb::class_<Grid>(m, "Grid")
        .def(nb::init<int, int>(), "rows"_a, "cols"_a)
        .def(nb::init<const GridConfig&>(), "config"_a)
        // Cell access
        .def("in_bounds", &Grid::in_bounds, "cell"_a)
        .def("state", &Grid::state, "cell"_a)
        .def("neighbors_of", &Grid::neighbors_of, "cell"_a)
        // Editing
        .def("set_cell_state", &Grid::set_cell_state, "cell"_a, "state"_a)
        .def("toggle_obstacle", &Grid::toggle_obstacle, "cell"_a)
        .def("mark_rect_obstacle", &Grid::mark_rect_obstacle, "a"_a, "b"_a)
        .def("reset", &Grid::reset)
        // Properties
        .def_prop_ro("rows", &Grid::rows)
        .def_prop_ro("cols", &Grid::cols)
        .def_prop_ro("total_cells", &Grid::total_cells)
        .def_prop_ro("start", &Grid::start)
        .def_prop_ro("target", &Grid::target)
        .def_prop_ro("default_start", &Grid::default_start)
        .def_prop_ro("default_target", &Grid::default_target)
        // Statistics
        .def("count_obstacles", &Grid::count_obstacles)
        .def("__str__", &Grid::to_string)
        .def("__eq__", [](const Grid& a, const Grid& b) { return a == b; });

    // StepEvent struct
    nb::class_<StepEvent>(m, "StepEvent")
        .def_ro("visited", &StepEvent::visited)
        .def_ro("frontier_updates", &StepEvent::frontier_updates)
        .def_ro("state", &StepEvent::state);

    // SearchRun class; iterating it yields StepEvents until the terminal one
    nb::class_<SearchRun>(m, "SearchRun")
        .def(nb::init<const Grid&, const Cell&, const Cell&, bool>(),
             "grid"_a, "start"_a, "target"_a, "visual"_a = false,
             nb::keep_alive<1, 2>())
        .def("next", &SearchRun::next)
        .def("__iter__", [](SearchRun& run) -> SearchRun& { return run; },
             nb::rv_policy::reference)
        .def("__next__", [](SearchRun& run) {
            auto event = run.next();
            if (!event) {
                throw nb::stop_iteration();
            }
            return *event;
        })
        .def("solve", &SearchRun::solve)
        .def("reconstruct_path", &SearchRun::reconstruct_path)
        .def("status_of", &SearchRun::status_of, "cell"_a)
        .def("g_cost", &SearchRun::g_cost, "cell"_a)
        .def("f_cost", &SearchRun::f_cost, "cell"_a)
        .def_prop_ro("state", &SearchRun::state)
        .def_prop_ro("is_finished", &SearchRun::is_finished)
        .def_prop_ro("visual", &SearchRun::visual)
        .def_prop_ro("start", &SearchRun::start)
        .def_prop_ro("target", &SearchRun::target)
        .def_prop_ro("steps", &SearchRun::steps)
        .def_prop_ro("nodes_explored", &SearchRun::nodes_explored);

    m.def("start_search",
          nb::overload_cast<const Grid&, const Cell&, const Cell&, bool>(&start_search),
          "grid"_a, "start"_a, "target"_a, "visual"_a = false, nb::keep_alive<0, 1>());
    m.def("start_search", nb::overload_cast<const Grid&, bool>(&start_search),
          "grid"_a, "visual"_a = false, nb::keep_alive<0, 1>());
    m.def("find_path",
          nb::overload_cast<const Grid&, const Cell&, const Cell&>(&find_path),
          "grid"_a, "start"_a, "target"_a);
    m.def("find_path", nb::overload_cast<const Grid&>(&find_path), "grid"_a);

    m.def("heuristic", &heuristic, "a"_a, "b"_a);
    m.def("edge_cost", &edge_cost, "a"_a, "b"_a);

    // Logging: "trace", "debug", "info", "warn", "error", "critical", "off"
    m.def("set_log_level", [](const std::string& level) {
        logsys::set_level(spdlog::level::from_str(level));
    }, "level"_a);
    m.def("log_to_file", &logsys::init_file_logs, "path"_a);

    // Version info
    m.def("version", []() { return "1.0.0"; });
    m.def("is_available", []() { return true; });
}
