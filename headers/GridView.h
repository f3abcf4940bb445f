#pragma once
#include <SFML/Graphics.hpp>
#include <vector>
#include "GridBoard.h"
#include "GridLayout.h"
#include "SearchEngine.h"

/**
 * draws a GridBoard as colored tiles plus whatever the current search painted on top.
 * search results live in an overlay, so clearing a run touches only the tiles that
 * run painted instead of rebuilding the whole board
 */
class GridView
{
public:
    enum class TileState
    {
        Free,
        Blocked,
        Start,
        End,
        Explored,
        Path
    };

    static sf::Color tileColor(TileState state);

    void setLayout(const GridLayout &layout) { layout_ = layout; }
    const GridLayout &getLayout() const { return layout_; }

    // sizes the overlay for the board, dropping anything painted
    void resetForBoard(const GridBoard &board);

    void markExplored(const GridCell &cell);
    void markPath(const GridCell &cell);

    // paints path cells [0, revealedLength) not painted yet
    void revealPath(const std::vector<GridCell> &path, int revealedLength);

    // back to the board colors, only tiles from the last run are touched
    void clearPainted();
    int getPaintedCount() const { return static_cast<int>(painted_.size()); }

    // what a tile looks like right now, endpoints beat path beats explored
    TileState tileStateAt(const GridBoard &board, int x, int y) const;

    // listener that feeds explored cells into this view
    SearchListener makeListener();

    void draw(sf::RenderTarget &target, const GridBoard &board) const;

private:
    void paint(const GridCell &cell, TileState state);

    GridLayout layout_;
    int width_ = 0;
    int height_ = 0;
    std::vector<TileState> overlay_; // Free = nothing painted
    std::vector<int> painted_;       // indices touched by the current run
    int pathPainted_ = 0;
};
