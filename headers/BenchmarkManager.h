#pragma once
#include <vector>
#include <string>
#include <ostream>
#include <optional>
#include "SearchSettings.h"
#include "Pathfinder.h"

// all the results of empirical doubling test per algorithm
struct DoublingResult {
    SearchSettings::Algos algorithm;
    std::string algoName;
    int problemSize;           // N (board cells)
    double timeMs;             // average pathfinding compute time over the trials
    int nodesExpanded;         // explored cells on the last trial
    int pathLength;            // unit moves, 0 when no path
    double ratio;              // T(2N) / T(N), 0 on the first level
    std::string estimatedBigO; // estimated complexity
};

/**
 * empirical doubling experiment: square random boards whose cell count doubles
 * level by level, start in the top left corner and end in the bottom right.
 * every algorithm runs on the same boards so the numbers compare directly
 */
class BenchmarkManager {
public:
    BenchmarkManager() = default;

    // returns false when the parameters are unusable or a board could not be generated
    bool runDoublingExperiment(int baseSize = 16, int levels = 6, int trials = 3,
                               float density = 0.25f, std::optional<unsigned> seed = std::nullopt);
    const std::vector<DoublingResult>& getDoublingResults() const { return doublingResults_; }

    void printReport(std::ostream& out) const;

    // algorithms in the benchmark
    static const std::vector<SearchSettings::Algos>& getBenchmarkAlgorithms();

    // side of the square board for a level, level 1 is baseSize
    static int boardSideForLevel(int baseSize, int level);

    static std::string estimateBigO(double ratio);

private:
    Pathfinder pathfinder_;
    std::vector<DoublingResult> doublingResults_;
};
