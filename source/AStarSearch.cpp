#include "AStarSearch.h"
#include <iostream>

void AStarSearch::beginSearch() {
    // unlike BFS every score array is reset over the whole grid each run
    buffers_.nextGeneration();
    buffers_.resetScores();

    const int h = manhattanDistance(start_, goal_);
    buffers_.gScore[startIndex_] = 0;
    buffers_.hScore[startIndex_] = h;
    buffers_.fScore[startIndex_] = h;
    buffers_.openSet.push(startIndex_);
}

StepResult AStarSearch::stepSearch() {
    IndexedMinHeap& openSet = buffers_.openSet;

    while (!openSet.empty()) {
        const int currentIndex = openSet.popMin();

        // already finalized through an earlier pop
        if (buffers_.isVisited(currentIndex)) continue;
        buffers_.markVisited(currentIndex);

        if (currentIndex == goalIndex_) {
            return StepResult::Found;
        }

        if (currentIndex != startIndex_) {
            reportExplored(currentIndex);
        }

        const GridCell current = grid_->fromIndex(currentIndex);
        const int currentG = buffers_.gScore[currentIndex];

        for (int dir = 0; dir < DIRECTION_COUNT; dir++) {
            const int nx = current.x + DIRECTION_X[dir];
            const int ny = current.y + DIRECTION_Y[dir];

            if (grid_->isBlocked(nx, ny)) continue;

            const int neighborIndex = grid_->toIndex(nx, ny);
            if (buffers_.isVisited(neighborIndex)) continue;

            const int tentativeG = currentG + MOVE_COST;
            if (tentativeG >= buffers_.gScore[neighborIndex]) continue;

            // strictly better route to this neighbor
            const int h = manhattanDistance(GridCell{nx, ny}, goal_);
            buffers_.parent[neighborIndex] = currentIndex;
            buffers_.gScore[neighborIndex] = tentativeG;
            buffers_.hScore[neighborIndex] = h;
            buffers_.fScore[neighborIndex] = tentativeG + h;

            const bool queued = openSet.contains(neighborIndex) ? openSet.decreaseKey(neighborIndex)
                                                                : openSet.push(neighborIndex);
            if (!queued) {
                std::cerr << "FATAL: A* open set rejected cell (" << nx << ", " << ny << ")" << std::endl;
                return StepResult::Failed;
            }
        }

        return StepResult::Continue;
    }

    return StepResult::Exhausted;
}
