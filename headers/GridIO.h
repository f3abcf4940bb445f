#pragma once
#include <string>
#include <vector>
#include <optional>
#include "Grid.h"

// plain text maps, one row per line:
//   '.' free   '#' blocked   'S' start   'E' end
// rows must all have the same length, at most one S and one E
struct GridMap {
    Grid grid;
    std::optional<GridCell> start;
    std::optional<GridCell> end;
};

// on failure returns false and, if error is given, describes the first problem
bool parseGridText(const std::string& text, GridMap& out, std::string* error = nullptr);
bool loadGridFromFile(const std::string& filename, GridMap& out);

// renders a map back to text, path cells as '*' and explored cells as 'o'
std::string formatGridText(const Grid& grid,
                           const std::optional<GridCell>& start,
                           const std::optional<GridCell>& end,
                           const std::vector<GridCell>& path = {},
                           const std::vector<GridCell>& explored = {});
bool saveGridToFile(const std::string& filename, const GridMap& map);
