// tests/test_heuristic.cpp
#include <doctest/doctest.h>

#include "gridpath/heuristic.hpp"

using namespace gridpath;

TEST_CASE("Heuristic/Manhattan") {
    CHECK(heuristic({0, 0}, {4, 4}) == 8);
    CHECK(heuristic({4, 4}, {0, 0}) == 8);
    CHECK(heuristic({2, 7}, {5, 1}) == 9);
}

TEST_CASE("Heuristic/ZeroOnlyOnSameCell") {
    CHECK(heuristic({3, 3}, {3, 3}) == 0);
    CHECK(heuristic({3, 3}, {3, 4}) > 0);
    CHECK(heuristic({3, 3}, {2, 3}) > 0);
}

TEST_CASE("Heuristic/ConsistentAcrossUnitEdges") {
    // h(a) <= cost(a, b) + h(b) for every adjacent pair
    const Cell target{2, 2};
    for (int r = 0; r < 5; ++r) {
        for (int c = 0; c < 5; ++c) {
            Cell a{r, c};
            Cell right{r, c + 1};
            Cell down{r + 1, c};
            CHECK(heuristic(a, target) <= edge_cost(a, right) + heuristic(right, target));
            CHECK(heuristic(a, target) <= edge_cost(a, down) + heuristic(down, target));
        }
    }
}

TEST_CASE("EdgeCost/Uniform") {
    CHECK(edge_cost({0, 0}, {0, 1}) == 1);
    CHECK(edge_cost({7, 3}, {6, 3}) == 1);
}
