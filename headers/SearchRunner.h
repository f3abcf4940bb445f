#pragma once
#include <optional>
#include "Grid.h"
#include "SearchEngine.h"

/**
 * frame driven pacing for one SearchEngine, the piece that decides when steps happen.
 * with a step delay it performs one step per elapsed delay; with no delay it burns
 * through up to maxStepsPerUpdate steps per update(). once the path is found it is
 * revealed one cell per update() so a viewer can draw it growing
 */
class SearchRunner
{
public:
    SearchRunner() = default;

    // only one run is active at a time, starting a new one cancels the old one
    bool start(SearchEngine &engine, const Grid &grid, const GridCell &startCell, const GridCell &goalCell);
    bool start(SearchEngine &engine, const Grid &grid,
               const std::optional<GridCell> &startCell, const std::optional<GridCell> &goalCell);
    void cancel();

    // returns the number of engine steps performed
    int update(float dtSeconds);

    bool isRunning() const { return engine_ != nullptr && engine_->isRunning(); }
    bool isRevealing() const;
    bool isActive() const { return isRunning() || isRevealing(); }

    SearchEngine *getEngine() const { return engine_; }
    int getRevealedPathLength() const { return revealedPathLength_; }
    StepResult getLastResult() const { return lastResult_; }

    void setStepDelay(float seconds) { stepDelaySeconds_ = seconds < 0.0f ? 0.0f : seconds; }
    float getStepDelay() const { return stepDelaySeconds_; }
    void setMaxStepsPerUpdate(int steps) { maxStepsPerUpdate_ = steps < 1 ? 1 : steps; }
    int getMaxStepsPerUpdate() const { return maxStepsPerUpdate_; }

private:
    SearchEngine *engine_ = nullptr;
    float stepDelaySeconds_ = 0.03f;
    int maxStepsPerUpdate_ = 2000;
    float accumulator_ = 0.0f;
    int revealedPathLength_ = 0;
    StepResult lastResult_ = StepResult::Continue;
};
