#include "SearchEngine.h"
#include "PathReconstruction.h"
#include <chrono>
#include <iostream>

const char* searchStatusName(SearchStatus status) {
    switch (status) {
        case SearchStatus::Idle:
            return "Idle";
        case SearchStatus::Running:
            return "Running";
        case SearchStatus::Found:
            return "Found";
        case SearchStatus::NoPath:
            return "No path";
        case SearchStatus::InvalidRequest:
            return "Invalid request";
        case SearchStatus::Cancelled:
            return "Cancelled";
        case SearchStatus::InternalError:
            return "Internal error";
        default:
            return "Unknown";
    }
}

bool SearchEngine::begin(const Grid& grid, const GridCell& start, const GridCell& goal) {
    // whatever ran before is superseded here, stale buffer contents are overwritten below
    path_.clear();
    exploredCount_ = 0;
    stepCount_ = 0;
    start_ = start;
    goal_ = goal;

    // fail fast: nothing gets explored for a request that can never succeed
    if (grid.getCellCount() <= 0 ||
        !grid.inBounds(start) || !grid.inBounds(goal) ||
        grid.isBlocked(start) || grid.isBlocked(goal)) {
        failRequest();
        return false;
    }

    grid_ = &grid;
    startIndex_ = grid.toIndex(start);
    goalIndex_ = grid.toIndex(goal);
    buffers_.ensureCapacity(grid.getCellCount());
    status_ = SearchStatus::Running;

    if (start == goal) {
        // trivial path, no exploration needed
        path_.push_back(start);
        status_ = SearchStatus::Found;
        if (listener_.onPathFound) listener_.onPathFound(path_);
        return true;
    }

    beginSearch();
    return true;
}

bool SearchEngine::begin(const Grid& grid, const std::optional<GridCell>& start,
                         const std::optional<GridCell>& goal) {
    if (!start.has_value() || !goal.has_value()) {
        path_.clear();
        exploredCount_ = 0;
        stepCount_ = 0;
        failRequest();
        return false;
    }
    return begin(grid, *start, *goal);
}

StepResult SearchEngine::step() {
    if (status_ != SearchStatus::Running) {
        return terminalResult();
    }

    StepResult result = stepSearch();
    stepCount_++;

    switch (result) {
        case StepResult::Continue:
            return StepResult::Continue;
        case StepResult::Found:
            return completeFound();
        case StepResult::Exhausted:
            status_ = SearchStatus::NoPath;
            if (listener_.onNoPath) listener_.onNoPath();
            return StepResult::Exhausted;
        case StepResult::Failed:
        default:
            status_ = SearchStatus::InternalError;
            return StepResult::Failed;
    }
}

void SearchEngine::cancel() {
    // buffers stay as they are, the next begin() supersedes them
    if (status_ == SearchStatus::Running) {
        status_ = SearchStatus::Cancelled;
    }
    grid_ = nullptr;
}

PathResult SearchEngine::run(const Grid& grid, const GridCell& start, const GridCell& goal) {
    auto startTime = std::chrono::high_resolution_clock::now();
    PathResult result;

    if (begin(grid, start, goal)) {
        while (step() == StepResult::Continue) {
        }
    }

    result.status = status_;
    result.found = (status_ == SearchStatus::Found);
    result.nodesExpanded = exploredCount_;
    if (result.found) {
        result.path = path_;
        result.pathLength = static_cast<int>(path_.size()) - 1;
    }

    auto endTime = std::chrono::high_resolution_clock::now();
    result.computeTimeMs = std::chrono::duration<double, std::milli>(endTime - startTime).count();

    return result;
}

void SearchEngine::reportExplored(int index) {
    exploredCount_++;
    if (listener_.onCellExplored) {
        listener_.onCellExplored(grid_->fromIndex(index));
    }
}

StepResult SearchEngine::terminalResult() const {
    switch (status_) {
        case SearchStatus::Found:
            return StepResult::Found;
        case SearchStatus::NoPath:
            return StepResult::Exhausted;
        default:
            return StepResult::Failed;
    }
}

StepResult SearchEngine::completeFound() {
    if (!reconstructPath(buffers_.parent, startIndex_, goalIndex_, grid_->getWidth(), path_)) {
        // broken parent chain means the engine bookkeeping is wrong, never report it as "no path"
        std::cerr << "FATAL: " << getName() << " parent chain from (" << goal_.x << ", " << goal_.y
                  << ") does not lead back to start (" << start_.x << ", " << start_.y << ")" << std::endl;
        status_ = SearchStatus::InternalError;
        return StepResult::Failed;
    }

    status_ = SearchStatus::Found;
    if (listener_.onPathFound) listener_.onPathFound(path_);
    return StepResult::Found;
}

void SearchEngine::failRequest() {
    grid_ = nullptr;
    startIndex_ = -1;
    goalIndex_ = -1;
    status_ = SearchStatus::InvalidRequest;
}
