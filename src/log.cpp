/*
 * GridPath C++ Core - Logging Implementation
 * Part of gridpath interactive A* pathfinding
 */

#include "gridpath/log.hpp"
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace gridpath::logsys {

namespace {

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_logger_mutex;

}  // namespace

std::shared_ptr<spdlog::logger> get() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (!g_logger) {
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        g_logger = std::make_shared<spdlog::logger>("gridpath", sink);
        g_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e][%n][%l] %v");
        g_logger->set_level(spdlog::level::warn);
    }
    return g_logger;
}

void init_file_logs(const std::string& path) {
    auto logger = get();
    auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, 1 << 20, 4);
    sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e][%l] %v");
    logger->sinks().push_back(sink);
    logger->info("File logging started: {}", path);
}

void set_level(spdlog::level::level_enum level) {
    get()->set_level(level);
}

}  // namespace gridpath::logsys
