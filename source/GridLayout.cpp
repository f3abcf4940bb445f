#include "GridLayout.h"
#include <algorithm>
#include <cmath>

GridLayout GridLayout::compute(int columns, int rows, float areaX, float areaY,
                               float areaWidth, float areaHeight, float baseSide, float offset)
{
    GridLayout layout;
    layout.columns = std::max(0, columns);
    layout.rows = std::max(0, rows);
    if (layout.columns == 0 || layout.rows == 0 || baseSide <= 0.0f)
        return layout;

    offset = std::max(0.0f, offset);

    // size at scale 1, then shrink uniformly to fit
    float baseTotalW = layout.columns * baseSide + (layout.columns - 1) * offset;
    float baseTotalH = layout.rows * baseSide + (layout.rows - 1) * offset;

    float scaleW = baseTotalW > 0.0f ? (areaWidth / baseTotalW) : 1.0f;
    float scaleH = baseTotalH > 0.0f ? (areaHeight / baseTotalH) : 1.0f;
    float scale = std::clamp(std::min(scaleW, scaleH), 0.0f, 1.0f);

    layout.side = baseSide * scale;
    layout.spacing = offset * scale;

    layout.originX = areaX + (areaWidth - layout.getTotalWidth()) * 0.5f;
    layout.originY = areaY + (areaHeight - layout.getTotalHeight()) * 0.5f;
    return layout;
}

float GridLayout::getTotalWidth() const
{
    if (columns == 0)
        return 0.0f;
    return columns * side + (columns - 1) * spacing;
}

float GridLayout::getTotalHeight() const
{
    if (rows == 0)
        return 0.0f;
    return rows * side + (rows - 1) * spacing;
}

std::optional<GridCell> GridLayout::cellAt(float px, float py) const
{
    float step = getStep();
    if (step <= 0.0f)
        return std::nullopt;

    float localX = px - originX;
    float localY = py - originY;
    if (localX < 0.0f || localY < 0.0f)
        return std::nullopt;

    int ix = static_cast<int>(std::floor(localX / step));
    int iy = static_cast<int>(std::floor(localY / step));
    if (ix >= columns || iy >= rows)
        return std::nullopt;

    // inside the gap to the right of / below the tile
    if (localX - ix * step > side || localY - iy * step > side)
        return std::nullopt;

    return GridCell{ix, iy};
}
