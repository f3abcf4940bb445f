#pragma once
#include <optional>
#include "Grid.h"

/**
 * screen placement of square tiles separated by a gap, centred in an area and
 * shrunk (never grown) so the whole grid fits. y grows downward, row 0 on top
 */
struct GridLayout
{
    int columns = 0;
    int rows = 0;
    float side = 0.0f;    // tile edge in pixels
    float spacing = 0.0f; // gap between tiles in pixels
    float originX = 0.0f; // top left corner of tile (0, 0)
    float originY = 0.0f;

    static GridLayout compute(int columns, int rows, float areaX, float areaY,
                              float areaWidth, float areaHeight, float baseSide, float offset);

    float getStep() const { return side + spacing; }
    float getTotalWidth() const;
    float getTotalHeight() const;

    // top left corner of a tile
    float tileX(int x) const { return originX + x * getStep(); }
    float tileY(int y) const { return originY + y * getStep(); }

    // tile under a point; nothing for points in the gaps or off the grid
    std::optional<GridCell> cellAt(float px, float py) const;
};
