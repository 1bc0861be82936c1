/*
 * GridPath C++ Core - Logging
 * Part of gridpath interactive A* pathfinding
 */

#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace gridpath::logsys {

// Project logger "gridpath"; created on first use with a stderr sink at warn level
std::shared_ptr<spdlog::logger> get();

// Adds a rotating file sink (1MB * 4) to the project logger
void init_file_logs(const std::string& path);

void set_level(spdlog::level::level_enum level);

}  // namespace gridpath::logsys
