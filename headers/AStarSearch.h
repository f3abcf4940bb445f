#pragma once
#include "SearchEngine.h"

/**
 * A* with the manhattan heuristic over unit cost 4-connected moves
 *
 * open set is an IndexedMinHeap keyed by fScore with ties going to the cell nearer the
 * goal (smaller hScore), which keeps the explored region narrow. a cell is finalized only
 * when popped, and the goal ends the search only when it is popped, never on discovery.
 * each Continue step is one pop/expand cycle
 */
class AStarSearch : public SearchEngine {
public:
    const char* getName() const override { return "A*"; }

    // cost of a single move; the heuristic stays admissible only for unit cost
    static constexpr int MOVE_COST = 1;

protected:
    void beginSearch() override;
    StepResult stepSearch() override;
};
