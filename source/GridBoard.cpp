#include "GridBoard.h"
#include <algorithm>
#include <random>
#include <vector>

GridBoard::GridBoard(int width, int height) {
    resize(width, height);
}

void GridBoard::resize(int width, int height) {
    grid_.resize(width, height);
    clearSelection();
}

bool GridBoard::selectCell(int x, int y) {
    // walls and clicks outside the board can't be endpoints
    if (grid_.isBlocked(x, y)) {
        return false;
    }

    if (stage_ == ClickStage::PickStart) {
        startCell_ = GridCell{x, y};
        stage_ = ClickStage::PickEnd;
        return true;
    }

    endCell_ = GridCell{x, y};
    stage_ = ClickStage::PickStart;
    return true;
}

bool GridBoard::setStartCell(const GridCell& cell) {
    if (grid_.isBlocked(cell)) return false;
    startCell_ = cell;
    return true;
}

bool GridBoard::setEndCell(const GridCell& cell) {
    if (grid_.isBlocked(cell)) return false;
    endCell_ = cell;
    return true;
}

void GridBoard::clearSelection() {
    startCell_.reset();
    endCell_.reset();
    stage_ = ClickStage::PickStart;
}

bool GridBoard::toggleBlock(int x, int y) {
    if (!grid_.inBounds(x, y)) return false;

    bool nowBlocked = grid_.toggleBlocked(x, y);
    if (nowBlocked) {
        // a wall dropped on an endpoint removes that endpoint
        const GridCell cell{x, y};
        if (startCell_ && *startCell_ == cell) startCell_.reset();
        if (endCell_ && *endCell_ == cell) endCell_.reset();
    }
    return true;
}

bool GridBoard::randomizeBlocksEnsuringPath(float blockProbability, int maxAttempts,
                                            std::optional<unsigned> seed) {
    if (grid_.getCellCount() == 0) return false;
    if (!startCell_ || !endCell_) return false;

    blockProbability = std::clamp(blockProbability, 0.0f, 1.0f);

    const int startIndex = grid_.toIndex(*startCell_);
    const int endIndex = grid_.toIndex(*endCell_);

    // backup current state so we can revert on failure
    std::vector<bool> backup(grid_.getCellCount());
    for (int i = 0; i < grid_.getCellCount(); i++) {
        backup[i] = grid_.getCellState(i) == CellState::Blocked;
    }

    std::mt19937 gen(seed.has_value() ? *seed : std::random_device{}());
    std::uniform_real_distribution<float> roll(0.0f, 1.0f);

    for (int attempt = 0; attempt < maxAttempts; attempt++) {
        for (int i = 0; i < grid_.getCellCount(); i++) {
            const GridCell cell = grid_.fromIndex(i);
            if (i == startIndex || i == endIndex) {
                grid_.setBlocked(cell.x, cell.y, false);
                continue;
            }
            grid_.setBlocked(cell.x, cell.y, roll(gen) < blockProbability);
        }

        if (hasPath()) {
            return true;
        }
    }

    for (int i = 0; i < grid_.getCellCount(); i++) {
        const GridCell cell = grid_.fromIndex(i);
        grid_.setBlocked(cell.x, cell.y, backup[i]);
    }
    return false;
}

bool GridBoard::hasPath() {
    if (!reachability_.begin(grid_, startCell_, endCell_)) {
        return false;
    }
    StepResult result = StepResult::Continue;
    while (result == StepResult::Continue) {
        result = reachability_.step();
    }
    return result == StepResult::Found;
}
