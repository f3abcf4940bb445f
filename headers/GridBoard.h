#pragma once
#include <optional>
#include "Grid.h"
#include "BreadthFirstSearch.h"

/**
 * the editable board behind the viewer and the cli: a grid plus the current
 * start/end selection and random obstacle generation that keeps a route open
 */
class GridBoard {
public:
    // clicks alternate between choosing the start and choosing the end
    enum class ClickStage {
        PickStart,
        PickEnd
    };

    GridBoard() = default;
    GridBoard(int width, int height);

    void resize(int width, int height);

    Grid& getGrid() { return grid_; }
    const Grid& getGrid() const { return grid_; }
    int getWidth() const { return grid_.getWidth(); }
    int getHeight() const { return grid_.getHeight(); }

    // selection
    const std::optional<GridCell>& getStartCell() const { return startCell_; }
    const std::optional<GridCell>& getEndCell() const { return endCell_; }
    ClickStage getClickStage() const { return stage_; }
    bool selectCell(int x, int y);
    bool setStartCell(const GridCell& cell);
    bool setEndCell(const GridCell& cell);
    void clearSelection();

    // obstacles
    bool toggleBlock(int x, int y);
    void clearBlocks() { grid_.clearObstacles(); }

    // fills every cell except start/end with probability blockProbability, retrying until
    // start can still reach end. on failure the previous layout is restored
    bool randomizeBlocksEnsuringPath(float blockProbability, int maxAttempts = 100,
                                     std::optional<unsigned> seed = std::nullopt);

    bool hasPath();

private:
    Grid grid_;
    std::optional<GridCell> startCell_;
    std::optional<GridCell> endCell_;
    ClickStage stage_ = ClickStage::PickStart;

    // reused for reachability checks while generating
    BreadthFirstSearch reachability_;
};
