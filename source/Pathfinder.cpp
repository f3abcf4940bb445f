#include "Pathfinder.h"
#include <set>

PathResult Pathfinder::findPathBFS(const Grid& grid, const GridCell& start, const GridCell& goal) {
    return bfs_.run(grid, start, goal);
}

PathResult Pathfinder::findPathAStar(const Grid& grid, const GridCell& start, const GridCell& goal) {
    return astar_.run(grid, start, goal);
}

PathResult Pathfinder::findPath(SearchSettings::Algos algo, const Grid& grid,
                                const GridCell& start, const GridCell& goal) {
    return getEngine(algo).run(grid, start, goal);
}

PathResult Pathfinder::findPath(SearchSettings::Algos algo, const Grid& grid,
                                const std::optional<GridCell>& start, const std::optional<GridCell>& goal) {
    if (!start.has_value() || !goal.has_value()) {
        // no selection yet, same outcome as any other rejected request
        PathResult result;
        result.status = SearchStatus::InvalidRequest;
        return result;
    }
    return findPath(algo, grid, *start, *goal);
}

SearchEngine& Pathfinder::getEngine(SearchSettings::Algos algo) {
    switch (algo) {
        case SearchSettings::Algos::BFS:
            return bfs_;
        case SearchSettings::Algos::AStar:
        default:
            return astar_;
    }
}

bool Pathfinder::isValidPath(const Grid& grid, const std::vector<GridCell>& path,
                             const GridCell& start, const GridCell& goal) {
    if (path.empty() || path.front() != start || path.back() != goal) {
        return false;
    }

    std::set<GridCell> seen;
    for (size_t i = 0; i < path.size(); i++) {
        const GridCell& cell = path[i];
        if (grid.isBlocked(cell)) return false;
        if (!seen.insert(cell).second) return false;  // repeated cell

        // every move is exactly one unit along exactly one axis
        if (i > 0 && manhattanDistance(path[i - 1], cell) != 1) return false;
    }
    return true;
}
