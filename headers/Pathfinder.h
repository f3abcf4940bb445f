#pragma once
#include <vector>
#include <optional>
#include "Grid.h"
#include "SearchSettings.h"
#include "SearchEngine.h"
#include "BreadthFirstSearch.h"
#include "AStarSearch.h"

/**
 * one stop entry point for both algorithms
 * holds one engine per algorithm so repeated calls on a stable grid reuse their buffers.
 * the engines are also handed out for step by step use (see SearchRunner)
 */
class Pathfinder {
public:
    Pathfinder() = default;
    Pathfinder(const Pathfinder&) = delete;
    Pathfinder& operator=(const Pathfinder&) = delete;

    // pathfinding algos - all return PathResult with timing info
    PathResult findPathBFS(const Grid& grid, const GridCell& start, const GridCell& goal);
    PathResult findPathAStar(const Grid& grid, const GridCell& start, const GridCell& goal);

    // generic pathfinding dispatcher
    PathResult findPath(SearchSettings::Algos algo, const Grid& grid, const GridCell& start, const GridCell& goal);
    PathResult findPath(SearchSettings::Algos algo, const Grid& grid,
                        const std::optional<GridCell>& start, const std::optional<GridCell>& goal);

    SearchEngine& getEngine(SearchSettings::Algos algo);

    // path utilities
    static bool isValidPath(const Grid& grid, const std::vector<GridCell>& path,
                            const GridCell& start, const GridCell& goal);

private:
    BreadthFirstSearch bfs_;
    AStarSearch astar_;
};
