#include "PathReconstruction.h"
#include <algorithm>

bool reconstructPath(const std::vector<int>& parents, int startIndex, int goalIndex,
                     int gridWidth, std::vector<GridCell>& path) {
    path.clear();

    const int cellCount = static_cast<int>(parents.size());
    if (gridWidth <= 0 || startIndex < 0 || startIndex >= cellCount ||
        goalIndex < 0 || goalIndex >= cellCount) {
        return false;
    }

    // walking backwards through the parent links from goal toward start
    int current = goalIndex;
    while (current != startIndex) {
        if (static_cast<int>(path.size()) >= cellCount) {
            // longer than the grid: the links form a cycle
            path.clear();
            return false;
        }

        path.push_back(GridCell{current % gridWidth, current / gridWidth});

        int parent = parents[current];
        if (parent < 0 || parent >= cellCount) {
            path.clear();
            return false;
        }
        current = parent;
    }
    path.push_back(GridCell{startIndex % gridWidth, startIndex / gridWidth});

    // building goal->start so flip it to start->goal
    std::reverse(path.begin(), path.end());
    return true;
}
