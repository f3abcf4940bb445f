#include <doctest/doctest.h>
#include "AStarSearch.h"
#include "BreadthFirstSearch.h"
#include "Pathfinder.h"
#include "TestHelpers.h"

TEST_CASE("AStar/StraightLine") {
    Grid grid(32, 8);
    AStarSearch astar;

    PathResult result = astar.run(grid, GridCell{0, 4}, GridCell{31, 4});

    REQUIRE(result.found);
    CHECK(result.path.size() == 32u);
    CHECK(result.pathLength == 31);
    // the tie break keeps the search on the straight line
    CHECK(result.nodesExpanded == 30);
}

TEST_CASE("AStar/Blocked") {
    Grid grid(8, 8);
    for (int y = 0; y < 8; ++y) grid.setBlocked(4, y, true);

    AStarSearch astar;
    RecordedEvents events;
    astar.setListener(events.listener());
    PathResult result = astar.run(grid, GridCell{1, 1}, GridCell{6, 1});

    CHECK(result.status == SearchStatus::NoPath);
    CHECK(result.path.empty());
    CHECK(events.noPathCount == 1);
    // every cell left of the wall except the start
    CHECK(result.nodesExpanded == 4 * 8 - 1);
}

TEST_CASE("AStar/GoalEndsSearchOnlyWhenPopped") {
    Grid grid(3, 1);
    AStarSearch astar;
    RecordedEvents events;
    astar.setListener(events.listener());

    REQUIRE(astar.begin(grid, GridCell{0, 0}, GridCell{2, 0}));
    CHECK(astar.step() == StepResult::Continue);  // expands the start
    CHECK(astar.step() == StepResult::Continue);  // expands (1, 0), goal is only queued
    CHECK(astar.isRunning());
    CHECK(astar.step() == StepResult::Found);     // goal popped

    const std::vector<GridCell> explored = {{1, 0}};
    CHECK(events.explored == explored);
    CHECK(astar.getPath().size() == 3u);
}

TEST_CASE("AStar/OpenGridExploresOnlyThePath") {
    Grid grid(5, 5);
    AStarSearch astar;
    PathResult result = astar.run(grid, GridCell{0, 0}, GridCell{4, 4});

    REQUIRE(result.found);
    CHECK(result.path.size() == 9u);
    CHECK(result.nodesExpanded == 7);
    CHECK(Pathfinder::isValidPath(grid, result.path, GridCell{0, 0}, GridCell{4, 4}));
}

TEST_CASE("AStar/FindsShortestDetour") {
    GridMap map = mapFromRows({
        "S.#.E",
        "..#..",
        ".....",
    });

    AStarSearch astar;
    PathResult result = astar.run(map.grid, *map.start, *map.end);

    REQUIRE(result.found);
    CHECK(result.pathLength == 8);
    CHECK(Pathfinder::isValidPath(map.grid, result.path, *map.start, *map.end));
}

TEST_CASE("AStar/ScoresResetBetweenRuns") {
    GridMap open = mapFromRows({
        "S.....",
        "......",
        "......",
        ".....E",
    });
    GridMap walled = mapFromRows({
        "S.#...",
        "..#.#.",
        "..#.#.",
        "....#E",
    });

    AStarSearch reused;
    PathResult first = reused.run(open.grid, *open.start, *open.end);
    REQUIRE(first.found);

    // same engine on a different layout must match a fresh engine
    PathResult second = reused.run(walled.grid, *walled.start, *walled.end);
    AStarSearch fresh;
    PathResult expected = fresh.run(walled.grid, *walled.start, *walled.end);

    REQUIRE(second.found);
    CHECK(second.path == expected.path);
    CHECK(second.nodesExpanded == expected.nodesExpanded);

    // and after a size change
    Grid small(2, 2);
    PathResult third = reused.run(small, GridCell{0, 0}, GridCell{1, 1});
    REQUIRE(third.found);
    CHECK(third.pathLength == 2);
    CHECK(reused.getBuffers().getCapacity() == 4);
}

TEST_CASE("AStar/CancelledRunDoesNotAffectNextRun") {
    Grid grid(10, 10);
    AStarSearch astar;

    REQUIRE(astar.begin(grid, GridCell{0, 0}, GridCell{9, 9}));
    for (int i = 0; i < 5; ++i) astar.step();
    astar.cancel();
    CHECK(astar.getStatus() == SearchStatus::Cancelled);

    PathResult result = astar.run(grid, GridCell{9, 0}, GridCell{0, 9});
    REQUIRE(result.found);
    CHECK(result.pathLength == 18);
    CHECK(Pathfinder::isValidPath(grid, result.path, GridCell{9, 0}, GridCell{0, 9}));
}
