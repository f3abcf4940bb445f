#pragma once
#include <vector>
#include <cstdint>
#include <limits>
#include "IndexedMinHeap.h"

/**
 * run scoped arrays shared by both search engines, indexed by the dense cell index
 * expected usage is to keep one instance per engine so memory is reused run to run;
 * everything is reallocated only when the grid's cell count changes
 */
struct SearchBuffers {
    using Stamp = std::uint32_t;

    static constexpr int NO_PARENT = -1;
    static constexpr int INFINITE_COST = std::numeric_limits<int>::max();
    static constexpr Stamp MAX_STAMP = std::numeric_limits<Stamp>::max();

    // visitedStamp[i] == generation means "visited in the current run"
    std::vector<Stamp> visitedStamp;
    std::vector<int> parent;

    // BFS: fifo ring over a dense array, each cell is enqueued at most once per run
    std::vector<int> frontier;
    int frontierHead = 0;
    int frontierTail = 0;

    // A*: best known cost from start, g + h (heap key), h alone (heap tie break)
    std::vector<int> gScore;
    std::vector<int> fScore;
    std::vector<int> hScore;
    IndexedMinHeap openSet;

    // reallocates every array if the size differs and resets the counters, returns true if it did
    bool ensureCapacity(int size);
    int getCapacity() const { return static_cast<int>(visitedStamp.size()); }

    // starts a new run's visited set; clears the stamps when the counter would overflow
    void nextGeneration();
    Stamp getGeneration() const { return generation_; }
    void setGeneration(Stamp generation) { generation_ = generation; }

    bool isVisited(int index) const { return visitedStamp[index] == generation_; }
    void markVisited(int index) { visitedStamp[index] = generation_; }

    void resetFrontier() { frontierHead = 0; frontierTail = 0; }
    void pushFrontier(int index) { frontier[frontierTail++] = index; }
    int popFrontier() { return frontier[frontierHead++]; }
    bool frontierEmpty() const { return frontierHead >= frontierTail; }

    // full reset of the A* arrays and the open set, A* pays O(n) per run here
    void resetScores();

private:
    Stamp generation_ = 0;
};
