#pragma once
#include "SearchEngine.h"

// uninformed search in concentric rings, shortest path by number of moves.
// each Continue step discovers exactly one new cell. the goal is accepted the moment
// it is discovered instead of when it would be dequeued, so its neighbors are never expanded
class BreadthFirstSearch : public SearchEngine {
public:
    const char* getName() const override { return "BFS"; }

protected:
    void beginSearch() override;
    StepResult stepSearch() override;

private:
    int currentIndex_ = -1;
    int nextDirection_ = DIRECTION_COUNT;  // DIRECTION_COUNT = dequeue a new cell first
};
