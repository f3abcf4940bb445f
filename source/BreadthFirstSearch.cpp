#include "BreadthFirstSearch.h"

void BreadthFirstSearch::beginSearch() {
    // new visit stamp for this run instead of clearing a visited array
    buffers_.nextGeneration();
    buffers_.resetFrontier();

    buffers_.parent[startIndex_] = SearchBuffers::NO_PARENT;
    buffers_.markVisited(startIndex_);
    buffers_.pushFrontier(startIndex_);

    currentIndex_ = -1;
    nextDirection_ = DIRECTION_COUNT;
}

StepResult BreadthFirstSearch::stepSearch() {
    while (true) {
        if (nextDirection_ >= DIRECTION_COUNT) {
            if (buffers_.frontierEmpty()) {
                return StepResult::Exhausted;
            }
            currentIndex_ = buffers_.popFrontier();
            nextDirection_ = 0;
        }

        const GridCell current = grid_->fromIndex(currentIndex_);
        const int dir = nextDirection_++;
        const int nx = current.x + DIRECTION_X[dir];
        const int ny = current.y + DIRECTION_Y[dir];

        // out of bounds reads as blocked
        if (grid_->isBlocked(nx, ny)) continue;

        const int neighborIndex = grid_->toIndex(nx, ny);
        if (buffers_.isVisited(neighborIndex)) continue;

        // mark, link and enqueue together so an interruption here never leaves a half visited cell
        buffers_.markVisited(neighborIndex);
        buffers_.parent[neighborIndex] = currentIndex_;

        if (neighborIndex == goalIndex_) {
            return StepResult::Found;
        }

        buffers_.pushFrontier(neighborIndex);
        reportExplored(neighborIndex);
        return StepResult::Continue;
    }
}
