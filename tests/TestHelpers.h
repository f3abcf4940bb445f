#pragma once
#include <doctest/doctest.h>
#include <string>
#include <vector>
#include "GridIO.h"
#include "SearchEngine.h"

// builds a map from rows of '.', '#', 'S', 'E'
inline GridMap mapFromRows(const std::vector<std::string>& rows) {
    std::string text;
    for (const std::string& row : rows) {
        text += row;
        text += '\n';
    }
    GridMap map;
    std::string error;
    bool ok = parseGridText(text, map, &error);
    INFO(error);
    REQUIRE(ok);
    return map;
}

// records every listener callback of a run
struct RecordedEvents {
    std::vector<GridCell> explored;
    std::vector<std::vector<GridCell>> pathsFound;
    int noPathCount = 0;

    SearchListener listener() {
        SearchListener l;
        l.onCellExplored = [this](const GridCell& cell) { explored.push_back(cell); };
        l.onPathFound = [this](const std::vector<GridCell>& path) { pathsFound.push_back(path); };
        l.onNoPath = [this]() { noPathCount++; };
        return l;
    }

    int totalEvents() const {
        return static_cast<int>(explored.size() + pathsFound.size()) + noPathCount;
    }
};

// steps a begun engine until it stops returning Continue
inline StepResult stepToEnd(SearchEngine& engine) {
    StepResult result = StepResult::Continue;
    while (result == StepResult::Continue) {
        result = engine.step();
    }
    return result;
}
