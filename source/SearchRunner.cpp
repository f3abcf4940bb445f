#include "SearchRunner.h"

bool SearchRunner::start(SearchEngine &engine, const Grid &grid, const GridCell &startCell, const GridCell &goalCell)
{
    return start(engine, grid, std::optional<GridCell>(startCell), std::optional<GridCell>(goalCell));
}

bool SearchRunner::start(SearchEngine &engine, const Grid &grid,
                         const std::optional<GridCell> &startCell, const std::optional<GridCell> &goalCell)
{
    cancel();

    accumulator_ = 0.0f;
    revealedPathLength_ = 0;
    engine_ = &engine;

    if (!engine.begin(grid, startCell, goalCell))
    {
        lastResult_ = StepResult::Failed;
        return false;
    }

    // start == goal finishes inside begin()
    lastResult_ = engine.isRunning() ? StepResult::Continue : engine.step();
    return true;
}

void SearchRunner::cancel()
{
    if (engine_ != nullptr)
    {
        engine_->cancel();
    }
    engine_ = nullptr;
    accumulator_ = 0.0f;
    revealedPathLength_ = 0;
    lastResult_ = StepResult::Continue;
}

bool SearchRunner::isRevealing() const
{
    if (engine_ == nullptr || engine_->getStatus() != SearchStatus::Found)
        return false;
    return revealedPathLength_ < static_cast<int>(engine_->getPath().size());
}

int SearchRunner::update(float dtSeconds)
{
    if (engine_ == nullptr)
        return 0;

    // drawing one path cell per frame reads nicely in the viewer
    if (isRevealing())
    {
        revealedPathLength_++;
        return 0;
    }

    if (!engine_->isRunning())
        return 0;

    int budget = maxStepsPerUpdate_;
    if (stepDelaySeconds_ > 0.0f)
    {
        accumulator_ += dtSeconds;
        int due = static_cast<int>(accumulator_ / stepDelaySeconds_);
        if (due <= 0)
            return 0;
        accumulator_ -= due * stepDelaySeconds_;
        budget = due < maxStepsPerUpdate_ ? due : maxStepsPerUpdate_;
    }

    int steps = 0;
    while (steps < budget && engine_->isRunning())
    {
        lastResult_ = engine_->step();
        steps++;
    }
    return steps;
}
