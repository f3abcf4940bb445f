#include "Grid.h"
#include <algorithm>

Grid::Grid(int width, int height) {
    resize(width, height);
}

void Grid::resize(int width, int height) {
    // negative sizes collapse to an empty grid which every search rejects
    width_ = std::max(0, width);
    height_ = std::max(0, height);
    cells_.assign(static_cast<size_t>(width_) * static_cast<size_t>(height_), CellState::Free);
}

bool Grid::isBlocked(int x, int y) const {
    // outside the grid counts as a wall so callers can skip the bounds check
    if (!inBounds(x, y)) return true;
    return cells_[toIndex(x, y)] == CellState::Blocked;
}

bool Grid::setBlocked(int x, int y, bool blocked) {
    if (!inBounds(x, y)) return false;
    cells_[toIndex(x, y)] = blocked ? CellState::Blocked : CellState::Free;
    return true;
}

bool Grid::toggleBlocked(int x, int y) {
    if (!inBounds(x, y)) return false;
    CellState& state = cells_[toIndex(x, y)];
    state = (state == CellState::Blocked) ? CellState::Free : CellState::Blocked;
    return state == CellState::Blocked;
}

void Grid::clearObstacles() {
    std::fill(cells_.begin(), cells_.end(), CellState::Free);
}

int Grid::countBlocked() const {
    return static_cast<int>(std::count(cells_.begin(), cells_.end(), CellState::Blocked));
}
