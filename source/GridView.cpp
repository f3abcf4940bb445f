#include "GridView.h"
#include <algorithm>

sf::Color GridView::tileColor(TileState state)
{
    switch (state)
    {
    case TileState::Blocked:
        return sf::Color::Black;
    case TileState::Start:
        return sf::Color(40, 200, 60);
    case TileState::End:
        return sf::Color(220, 50, 50);
    case TileState::Explored:
        return sf::Color(240, 220, 60);
    case TileState::Path:
        return sf::Color(120, 230, 150);
    case TileState::Free:
    default:
        return sf::Color(200, 200, 200);
    }
}

void GridView::resetForBoard(const GridBoard &board)
{
    width_ = board.getWidth();
    height_ = board.getHeight();
    overlay_.assign(static_cast<size_t>(width_) * height_, TileState::Free);
    painted_.clear();
    pathPainted_ = 0;
}

void GridView::paint(const GridCell &cell, TileState state)
{
    if (cell.x < 0 || cell.y < 0 || cell.x >= width_ || cell.y >= height_)
        return;

    int index = cell.y * width_ + cell.x;
    if (overlay_[index] == TileState::Free)
        painted_.push_back(index);
    overlay_[index] = state;
}

void GridView::markExplored(const GridCell &cell)
{
    paint(cell, TileState::Explored);
}

void GridView::markPath(const GridCell &cell)
{
    paint(cell, TileState::Path);
}

void GridView::revealPath(const std::vector<GridCell> &path, int revealedLength)
{
    int limit = std::min(revealedLength, static_cast<int>(path.size()));
    for (; pathPainted_ < limit; pathPainted_++)
    {
        markPath(path[pathPainted_]);
    }
}

void GridView::clearPainted()
{
    for (int index : painted_)
    {
        overlay_[index] = TileState::Free;
    }
    painted_.clear();
    pathPainted_ = 0;
}

GridView::TileState GridView::tileStateAt(const GridBoard &board, int x, int y) const
{
    const GridCell cell{x, y};
    if (board.getStartCell() && *board.getStartCell() == cell)
        return TileState::Start;
    if (board.getEndCell() && *board.getEndCell() == cell)
        return TileState::End;
    if (board.getGrid().isBlocked(x, y))
        return TileState::Blocked;

    if (x >= 0 && y >= 0 && x < width_ && y < height_)
        return overlay_[y * width_ + x];
    return TileState::Free;
}

SearchListener GridView::makeListener()
{
    SearchListener listener;
    listener.onCellExplored = [this](const GridCell &cell)
    { markExplored(cell); };
    return listener;
}

void GridView::draw(sf::RenderTarget &target, const GridBoard &board) const
{
    if (layout_.side <= 0.0f)
        return;

    sf::RectangleShape tile(sf::Vector2f(layout_.side, layout_.side));
    for (int y = 0; y < board.getHeight(); y++)
    {
        for (int x = 0; x < board.getWidth(); x++)
        {
            tile.setPosition({layout_.tileX(x), layout_.tileY(y)});
            tile.setFillColor(tileColor(tileStateAt(board, x, y)));
            target.draw(tile);
        }
    }
}
