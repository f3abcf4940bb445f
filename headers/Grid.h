#pragma once
#include <vector>
#include <cstdint>
#include <cstdlib>
#include <functional>

// grid cell coordinates
struct GridCell {
    int x, y;

    bool operator==(const GridCell& other) const {
        return x == other.x && y == other.y;
    }

    bool operator!=(const GridCell& other) const {
        return !(*this == other);
    }

    // row major ordering so cells can live in std::set / std::map
    bool operator<(const GridCell& other) const {
        if (y != other.y) return y < other.y;
        return x < other.x;
    }
};

// hash function for GridCell (for use in unordered_map/set)
struct GridCellHash {
    size_t operator()(const GridCell& cell) const {
        return std::hash<int>()(cell.x) ^ (std::hash<int>()(cell.y) << 16);
    }
};

enum class CellState : std::uint8_t {
    Free,
    Blocked
};

// L1 distance, admissible and consistent for 4 connected unit cost moves
inline int manhattanDistance(const GridCell& a, const GridCell& b) {
    return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

/**
 * obstacle grid addressed either by (x, y) or by the dense index y * width + x
 * the grid may be edited between searches but never while one is running
 */
class Grid {
public:
    Grid() = default;
    Grid(int width, int height);

    // dimensions
    void resize(int width, int height);
    int getWidth() const { return width_; }
    int getHeight() const { return height_; }
    int getCellCount() const { return width_ * height_; }

    // queries
    bool inBounds(int x, int y) const { return x >= 0 && x < width_ && y >= 0 && y < height_; }
    bool inBounds(const GridCell& cell) const { return inBounds(cell.x, cell.y); }
    bool isBlocked(int x, int y) const;
    bool isBlocked(const GridCell& cell) const { return isBlocked(cell.x, cell.y); }
    CellState getCellState(int index) const { return cells_[index]; }

    // dense addressing
    int toIndex(int x, int y) const { return y * width_ + x; }
    int toIndex(const GridCell& cell) const { return cell.y * width_ + cell.x; }
    GridCell fromIndex(int index) const { return GridCell{index % width_, index / width_}; }

    // obstacle editing (between runs only)
    bool setBlocked(int x, int y, bool blocked);
    bool toggleBlocked(int x, int y);
    void clearObstacles();
    int countBlocked() const;

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<CellState> cells_;
};
