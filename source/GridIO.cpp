#include "GridIO.h"
#include <fstream>
#include <sstream>
#include <iostream>
#include <utility>

namespace {

bool fail(std::string* error, const std::string& message) {
    if (error != nullptr) *error = message;
    return false;
}

}

bool parseGridText(const std::string& text, GridMap& out, std::string* error) {
    std::vector<std::string> rows;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        rows.push_back(line);
    }

    // trailing blank lines are allowed, anything blank before them is a ragged row
    while (!rows.empty() && rows.back().empty()) rows.pop_back();
    if (rows.empty()) {
        return fail(error, "map is empty");
    }

    const int width = static_cast<int>(rows[0].size());
    const int height = static_cast<int>(rows.size());
    if (width == 0) {
        return fail(error, "map row 1 is empty");
    }

    GridMap map;
    map.grid.resize(width, height);

    for (int y = 0; y < height; y++) {
        if (static_cast<int>(rows[y].size()) != width) {
            return fail(error, "row " + std::to_string(y + 1) + " has " + std::to_string(rows[y].size()) +
                                   " cells, expected " + std::to_string(width));
        }

        for (int x = 0; x < width; x++) {
            const char c = rows[y][x];
            switch (c) {
                case '.':
                    break;
                case '#':
                    map.grid.setBlocked(x, y, true);
                    break;
                case 'S':
                    if (map.start) return fail(error, "more than one start cell 'S'");
                    map.start = GridCell{x, y};
                    break;
                case 'E':
                    if (map.end) return fail(error, "more than one end cell 'E'");
                    map.end = GridCell{x, y};
                    break;
                default:
                    return fail(error, std::string("unexpected character '") + c + "' at row " +
                                           std::to_string(y + 1) + ", column " + std::to_string(x + 1));
            }
        }
    }

    out = std::move(map);
    return true;
}

bool loadGridFromFile(const std::string& filename, GridMap& out) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open map file for reading: " << filename << std::endl;
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    std::string error;
    if (!parseGridText(buffer.str(), out, &error)) {
        std::cerr << "Error: " << filename << ": " << error << std::endl;
        return false;
    }
    return true;
}

std::string formatGridText(const Grid& grid,
                           const std::optional<GridCell>& start,
                           const std::optional<GridCell>& end,
                           const std::vector<GridCell>& path,
                           const std::vector<GridCell>& explored) {
    const int width = grid.getWidth();
    const int height = grid.getHeight();

    std::vector<std::string> rows(height, std::string(width, '.'));
    for (int y = 0; y < height; y++) {
        for (int x = 0; x < width; x++) {
            if (grid.isBlocked(x, y)) rows[y][x] = '#';
        }
    }

    // later layers win: explored, then path, then the endpoints
    for (const GridCell& cell : explored) {
        if (grid.inBounds(cell)) rows[cell.y][cell.x] = 'o';
    }
    for (const GridCell& cell : path) {
        if (grid.inBounds(cell)) rows[cell.y][cell.x] = '*';
    }
    if (start && grid.inBounds(*start)) rows[start->y][start->x] = 'S';
    if (end && grid.inBounds(*end)) rows[end->y][end->x] = 'E';

    std::string text;
    text.reserve(static_cast<size_t>(width + 1) * height);
    for (const std::string& row : rows) {
        text += row;
        text += '\n';
    }
    return text;
}

bool saveGridToFile(const std::string& filename, const GridMap& map) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open map file for writing: " << filename << std::endl;
        return false;
    }

    file << formatGridText(map.grid, map.start, map.end);
    if (!file.good()) {
        std::cerr << "Error: Failed writing map to: " << filename << std::endl;
        return false;
    }
    return true;
}
