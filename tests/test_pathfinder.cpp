#include <doctest/doctest.h>
#include <cstring>
#include "Pathfinder.h"

TEST_CASE("Pathfinder/DispatchesByAlgorithm") {
    Pathfinder pathfinder;
    CHECK(std::strcmp(pathfinder.getEngine(SearchSettings::Algos::BFS).getName(), "BFS") == 0);
    CHECK(std::strcmp(pathfinder.getEngine(SearchSettings::Algos::AStar).getName(), "A*") == 0);

    Grid grid(6, 6);
    PathResult result = pathfinder.findPath(SearchSettings::Algos::BFS, grid, GridCell{0, 0}, GridCell{5, 5});
    REQUIRE(result.found);
    CHECK(result.status == SearchStatus::Found);
    CHECK(result.pathLength == 10);
    CHECK(result.pathLength == static_cast<int>(result.path.size()) - 1);
    CHECK(result.computeTimeMs >= 0.0);
    CHECK(pathfinder.getEngine(SearchSettings::Algos::BFS).getStatus() == SearchStatus::Found);
    CHECK(pathfinder.getEngine(SearchSettings::Algos::AStar).getStatus() == SearchStatus::Idle);
}

TEST_CASE("Pathfinder/MissingSelectionIsInvalid") {
    Pathfinder pathfinder;
    Grid grid(3, 3);

    PathResult result = pathfinder.findPath(SearchSettings::Algos::AStar, grid,
                                            std::optional<GridCell>(GridCell{0, 0}), std::nullopt);
    CHECK(result.status == SearchStatus::InvalidRequest);
    CHECK_FALSE(result.found);
    CHECK(result.path.empty());
}

TEST_CASE("Pathfinder/IsValidPath") {
    Grid grid(3, 3);
    grid.setBlocked(1, 1, true);
    const GridCell start{0, 0};
    const GridCell goal{2, 0};

    CHECK(Pathfinder::isValidPath(grid, {{0, 0}, {1, 0}, {2, 0}}, start, goal));

    CHECK_FALSE(Pathfinder::isValidPath(grid, {}, start, goal));
    CHECK_FALSE(Pathfinder::isValidPath(grid, {{0, 0}, {1, 0}}, start, goal));              // wrong end
    CHECK_FALSE(Pathfinder::isValidPath(grid, {{0, 0}, {2, 0}}, start, goal));              // jump
    CHECK_FALSE(Pathfinder::isValidPath(grid, {{0, 0}, {1, 1}, {2, 0}}, start, goal));      // diagonal, blocked
    CHECK_FALSE(Pathfinder::isValidPath(grid, {{0, 0}, {1, 0}, {0, 0}, {1, 0}, {2, 0}}, start, goal));  // repeat
}
