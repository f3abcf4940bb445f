#include <doctest/doctest.h>
#include "SearchRunner.h"
#include "BreadthFirstSearch.h"
#include "AStarSearch.h"

TEST_CASE("Runner/NoDelayFinishesWithinOneUpdate") {
    Grid grid(5, 1);
    BreadthFirstSearch bfs;
    SearchRunner runner;
    runner.setStepDelay(0.0f);
    runner.setMaxStepsPerUpdate(1000);

    REQUIRE(runner.start(bfs, grid, GridCell{0, 0}, GridCell{4, 0}));
    CHECK(runner.isRunning());
    CHECK(runner.update(0.016f) == 4);
    CHECK(runner.getLastResult() == StepResult::Found);
    CHECK(bfs.getStatus() == SearchStatus::Found);

    // path is revealed one cell per update
    CHECK(runner.isRevealing());
    for (int i = 1; i <= 5; ++i) {
        CHECK(runner.update(0.016f) == 0);
        CHECK(runner.getRevealedPathLength() == i);
    }
    CHECK_FALSE(runner.isRevealing());
    CHECK_FALSE(runner.isActive());
    CHECK(runner.update(0.016f) == 0);
    CHECK(runner.getRevealedPathLength() == 5);
}

TEST_CASE("Runner/StepDelayPacesSteps") {
    Grid grid(10, 1);
    BreadthFirstSearch bfs;
    SearchRunner runner;
    runner.setStepDelay(0.1f);

    REQUIRE(runner.start(bfs, grid, GridCell{0, 0}, GridCell{9, 0}));
    CHECK(runner.update(0.05f) == 0);
    CHECK(runner.update(0.07f) == 1);
    CHECK(runner.update(0.25f) == 2);
    CHECK(bfs.getStepCount() == 3);
    CHECK(runner.isRunning());
}

TEST_CASE("Runner/StepBudgetCapsEachUpdate") {
    Grid grid(10, 1);
    AStarSearch astar;
    SearchRunner runner;
    runner.setStepDelay(0.0f);
    runner.setMaxStepsPerUpdate(3);

    REQUIRE(runner.start(astar, grid, GridCell{0, 0}, GridCell{9, 0}));
    CHECK(runner.update(1.0f) == 3);
    CHECK(runner.isRunning());
    CHECK(runner.update(1.0f) == 3);
    CHECK(runner.update(1.0f) == 3);
    // the tenth step pops the goal
    CHECK(runner.update(1.0f) == 1);
    CHECK(runner.getLastResult() == StepResult::Found);
}

TEST_CASE("Runner/StartingAgainCancelsTheOldRun") {
    Grid grid(8, 8);
    BreadthFirstSearch bfs;
    AStarSearch astar;
    SearchRunner runner;
    runner.setStepDelay(0.0f);
    runner.setMaxStepsPerUpdate(2);

    REQUIRE(runner.start(bfs, grid, GridCell{0, 0}, GridCell{7, 7}));
    runner.update(0.016f);
    CHECK(bfs.isRunning());

    REQUIRE(runner.start(astar, grid, GridCell{0, 0}, GridCell{7, 7}));
    CHECK(bfs.getStatus() == SearchStatus::Cancelled);
    CHECK(runner.getEngine() == &astar);
    CHECK(astar.isRunning());
}

TEST_CASE("Runner/InvalidRequestDoesNotRun") {
    Grid grid(4, 4);
    BreadthFirstSearch bfs;
    SearchRunner runner;

    CHECK_FALSE(runner.start(bfs, grid, std::optional<GridCell>(GridCell{0, 0}), std::nullopt));
    CHECK(runner.getLastResult() == StepResult::Failed);
    CHECK_FALSE(runner.isRunning());
    CHECK(runner.update(1.0f) == 0);
    CHECK(bfs.getStatus() == SearchStatus::InvalidRequest);
}

TEST_CASE("Runner/StartEqualsGoalOnlyReveals") {
    Grid grid(4, 4);
    BreadthFirstSearch bfs;
    SearchRunner runner;

    REQUIRE(runner.start(bfs, grid, GridCell{1, 1}, GridCell{1, 1}));
    CHECK(runner.getLastResult() == StepResult::Found);
    CHECK_FALSE(runner.isRunning());
    CHECK(runner.isRevealing());
    runner.update(0.016f);
    CHECK(runner.getRevealedPathLength() == 1);
    CHECK_FALSE(runner.isActive());
}

TEST_CASE("Runner/CancelStopsStepping") {
    Grid grid(6, 6);
    BreadthFirstSearch bfs;
    SearchRunner runner;
    runner.setStepDelay(0.0f);
    runner.setMaxStepsPerUpdate(1);

    REQUIRE(runner.start(bfs, grid, GridCell{0, 0}, GridCell{5, 5}));
    runner.update(0.016f);
    runner.cancel();

    CHECK(bfs.getStatus() == SearchStatus::Cancelled);
    CHECK(runner.getEngine() == nullptr);
    CHECK(runner.update(0.016f) == 0);
    CHECK(bfs.getStepCount() == 1);
}
