#pragma once
#include <vector>
#include "Grid.h"

// walks parent links from goal back to start and writes the cells start -> goal into path.
// returns false (path left empty) if the chain hits the no-parent sentinel before the start,
// leaves the grid, or runs longer than the grid has cells; any of these means the
// visited/parent bookkeeping is broken
bool reconstructPath(const std::vector<int>& parents, int startIndex, int goalIndex,
                     int gridWidth, std::vector<GridCell>& path);
