// tests/test_main.cpp
//
// The only translation unit in the test executable that defines
// DOCTEST_CONFIG_IMPLEMENT. Other test files include doctest without it.
#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#undef DOCTEST_CONFIG_IMPLEMENT

#include "gridpath/log.hpp"

#include <cstdlib> // std::getenv
#include <cstring> // std::strcmp

namespace {

bool env_truthy(const char* v) {
    return v != nullptr && v[0] != '\0' && std::strcmp(v, "0") != 0;
}

bool running_in_ci() {
    return env_truthy(std::getenv("CI")) ||
           env_truthy(std::getenv("GITHUB_ACTIONS"));
}

} // namespace

int main(int argc, char** argv) {
    doctest::Context context;

    context.setOption("order-by", "name"); // deterministic ordering
    context.setOption("duration", true);

    if (running_in_ci()) {
        context.setOption("no-colors", true);
    }

    // Reconstruction failures and rejected edits are expected noise in some cases
    gridpath::logsys::set_level(spdlog::level::off);

    context.applyCommandLine(argc, argv);

    return context.run();
}
