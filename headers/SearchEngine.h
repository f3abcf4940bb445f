#pragma once
#include <vector>
#include <functional>
#include <optional>
#include "Grid.h"
#include "SearchBuffers.h"

// lifecycle of one run on an engine instance
enum class SearchStatus {
    Idle,            // nothing started yet
    Running,         // begin() accepted the request, step() makes progress
    Found,           // path available through getPath()
    NoPath,          // frontier exhausted, a normal outcome
    InvalidRequest,  // start/end missing, out of bounds or blocked; nothing was explored
    Cancelled,       // abandoned by the caller between steps
    InternalError    // parent links did not lead back to the start
};

// what a single step() did
enum class StepResult {
    Continue,   // made progress, call step() again
    Found,      // goal reached and path reconstructed
    Exhausted,  // no path exists
    Failed      // no active run (invalid, cancelled) or an internal invariant broke
};

const char* searchStatusName(SearchStatus status);

// result of a complete run
struct PathResult {
    std::vector<GridCell> path;          // the path from start to goal, both inclusive
    int nodesExpanded = 0;               // number of explored notifications during the run
    double computeTimeMs = 0.0;          // time taken to compute path in milliseconds
    bool found = false;                  // whether a path was found
    int pathLength = 0;                  // number of unit moves (path.size() - 1)
    SearchStatus status = SearchStatus::Idle;
};

// sink for visualization / logging, any callback may be left empty
struct SearchListener {
    std::function<void(const GridCell&)> onCellExplored;
    std::function<void(const std::vector<GridCell>&)> onPathFound;
    std::function<void()> onNoPath;
};

/**
 * incremental search over a Grid
 *
 * a run is begin() followed by step() until it stops returning Continue. between any
 * two steps the caller may pause or cancel. each engine owns its buffers and
 * reuses them across runs, so one instance must never run two searches at once;
 * use separate instances for concurrent searches
 */
class SearchEngine {
public:
    // 4-neighborhood in fixed expansion order: +x, -x, +y, -y
    static constexpr int DIRECTION_COUNT = 4;
    static constexpr int DIRECTION_X[DIRECTION_COUNT] = {1, -1, 0, 0};
    static constexpr int DIRECTION_Y[DIRECTION_COUNT] = {0, 0, 1, -1};

    virtual ~SearchEngine() = default;

    virtual const char* getName() const = 0;

    // validates the request and prepares a run. returns false for an invalid request,
    // in which case no listener callback fires. the grid must outlive the run
    bool begin(const Grid& grid, const GridCell& start, const GridCell& goal);
    bool begin(const Grid& grid, const std::optional<GridCell>& start, const std::optional<GridCell>& goal);

    StepResult step();
    void cancel();

    // begin + step to completion, timed
    PathResult run(const Grid& grid, const GridCell& start, const GridCell& goal);

    void setListener(SearchListener listener) { listener_ = std::move(listener); }
    void clearListener() { listener_ = SearchListener{}; }

    SearchStatus getStatus() const { return status_; }
    bool isRunning() const { return status_ == SearchStatus::Running; }
    const std::vector<GridCell>& getPath() const { return path_; }
    int getExploredCount() const { return exploredCount_; }
    int getStepCount() const { return stepCount_; }
    const GridCell& getStart() const { return start_; }
    const GridCell& getGoal() const { return goal_; }
    const SearchBuffers& getBuffers() const { return buffers_; }

protected:
    // engine specific setup, called after validation with buffers already sized
    virtual void beginSearch() = 0;
    // one suspension unit of the algorithm; Found means buffers_.parent leads goal -> start
    virtual StepResult stepSearch() = 0;

    void reportExplored(int index);

    const Grid* grid_ = nullptr;
    GridCell start_{0, 0};
    GridCell goal_{0, 0};
    int startIndex_ = -1;
    int goalIndex_ = -1;
    SearchBuffers buffers_;

private:
    StepResult terminalResult() const;
    StepResult completeFound();
    void failRequest();

    SearchListener listener_;
    SearchStatus status_ = SearchStatus::Idle;
    std::vector<GridCell> path_;
    int exploredCount_ = 0;
    int stepCount_ = 0;
};
