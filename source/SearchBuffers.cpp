#include "SearchBuffers.h"
#include <algorithm>

bool SearchBuffers::ensureCapacity(int size) {
    if (size < 0) size = 0;
    if (getCapacity() == size && openSet.getCapacity() == size) {
        return false;
    }

    // one allocation per grid size, every run after this reuses the same memory
    visitedStamp.assign(size, 0);
    parent.assign(size, NO_PARENT);
    frontier.assign(size, 0);
    gScore.assign(size, INFINITE_COST);
    fScore.assign(size, INFINITE_COST);
    hScore.assign(size, 0);
    openSet.reserve(size);

    generation_ = 0;
    resetFrontier();
    return true;
}

void SearchBuffers::nextGeneration() {
    generation_++;
    if (generation_ == MAX_STAMP) {
        // rare overflow guard: an old stamp could otherwise read as visited
        std::fill(visitedStamp.begin(), visitedStamp.end(), 0);
        generation_ = 1;
    }
}

void SearchBuffers::resetScores() {
    std::fill(gScore.begin(), gScore.end(), INFINITE_COST);
    std::fill(fScore.begin(), fScore.end(), INFINITE_COST);
    std::fill(hScore.begin(), hScore.end(), 0);
    std::fill(parent.begin(), parent.end(), NO_PARENT);
    openSet.clear();
    openSet.setKeys(&fScore, &hScore);
}
