#include "BenchmarkManager.h"
#include "GridBoard.h"
#include <cmath>
#include <iomanip>
#include <iostream>

const std::vector<SearchSettings::Algos> &BenchmarkManager::getBenchmarkAlgorithms()
{
    static const std::vector<SearchSettings::Algos> algos = {
        SearchSettings::Algos::BFS,
        SearchSettings::Algos::AStar};
    return algos;
}

int BenchmarkManager::boardSideForLevel(int baseSize, int level)
{
    // cell count doubles per level so the side grows by sqrt(2)
    double side = baseSize * std::pow(std::sqrt(2.0), level - 1);
    return static_cast<int>(std::lround(side));
}

std::string BenchmarkManager::estimateBigO(double ratio)
{
    // empirical doubling method: if T(2N)/T(N) = r then:
    //   r ~ 1   -> O(1)
    //   r ~ 2   -> O(n)
    //   r ~ 2-3 -> O(n log n)
    //   r ~ 4   -> O(n^2)
    // thresholds are widened to account for measurement noise and cache effects
    if (ratio < 1.2)
        return "O(1)";
    if (ratio < 1.5)
        return "O(log n)";
    if (ratio < 2.5)
        return "O(n)";
    if (ratio < 3.5)
        return "O(n log n)";
    if (ratio < 5.0)
        return "O(n^2)";
    return "O(n^2+)";
}

bool BenchmarkManager::runDoublingExperiment(int baseSize, int levels, int trials,
                                             float density, std::optional<unsigned> seed)
{
    doublingResults_.clear();
    if (baseSize < 2 || levels < 1 || trials < 1)
    {
        std::cerr << "Error: benchmark needs baseSize >= 2, levels >= 1 and trials >= 1" << std::endl;
        return false;
    }

    // boards are generated once per level and shared by every algorithm
    std::vector<GridBoard> boards;
    boards.reserve(levels);
    for (int level = 1; level <= levels; ++level)
    {
        int side = boardSideForLevel(baseSize, level);
        GridBoard board(side, side);
        board.setStartCell(GridCell{0, 0});
        board.setEndCell(GridCell{side - 1, side - 1});

        std::optional<unsigned> levelSeed;
        if (seed.has_value())
            levelSeed = *seed + static_cast<unsigned>(level);

        if (!board.randomizeBlocksEnsuringPath(density, 200, levelSeed))
        {
            std::cerr << "Error: could not generate a solvable " << side << "x" << side
                      << " board at density " << density << std::endl;
            doublingResults_.clear();
            return false;
        }
        boards.push_back(std::move(board));
    }

    for (auto algo : getBenchmarkAlgorithms())
    {
        double prevTime = 0.0;
        for (int level = 1; level <= levels; ++level)
        {
            const GridBoard &board = boards[level - 1];
            double totalMs = 0.0;
            PathResult res;
            for (int t = 0; t < trials; ++t)
            {
                res = pathfinder_.findPath(algo, board.getGrid(), board.getStartCell(), board.getEndCell());
                totalMs += res.computeTimeMs;
            }
            double avgMs = totalMs / trials;
            int problemSize = board.getGrid().getCellCount();
            double ratio = (level == 1 || prevTime <= 0.0) ? 0.0 : avgMs / prevTime;
            std::string est = (level == 1) ? "--" : estimateBigO(ratio);
            doublingResults_.push_back({algo, SearchSettings::algoNames(algo), problemSize, avgMs,
                                        res.nodesExpanded, res.pathLength, ratio, est});
            prevTime = avgMs;
        }
    }
    return true;
}

void BenchmarkManager::printReport(std::ostream &out) const
{
    out << "Empirical Doubling" << std::endl;
    out << std::left << std::setw(6) << "Algo"
        << std::right << std::setw(10) << "N"
        << std::setw(12) << "ms"
        << std::setw(10) << "expanded"
        << std::setw(8) << "path"
        << std::setw(8) << "r"
        << "  " << "Big-O" << std::endl;

    for (const auto &r : doublingResults_)
    {
        out << std::left << std::setw(6) << r.algoName
            << std::right << std::setw(10) << r.problemSize
            << std::setw(12) << std::fixed << std::setprecision(4) << r.timeMs
            << std::setw(10) << r.nodesExpanded
            << std::setw(8) << r.pathLength
            << std::setw(8) << std::setprecision(2) << r.ratio
            << "  " << r.estimatedBigO << std::endl;
    }

    // average ratio across all doublings per algorithm
    for (auto algo : getBenchmarkAlgorithms())
    {
        double sumRatio = 0.0;
        int ratioCount = 0;
        for (const auto &r : doublingResults_)
        {
            if (r.algorithm == algo && r.ratio > 0.0)
            {
                sumRatio += r.ratio;
                ratioCount++;
            }
        }
        if (ratioCount == 0)
            continue;
        double avgRatio = sumRatio / ratioCount;
        out << SearchSettings::algoNames(algo) << ": avg r = " << std::setprecision(2) << avgRatio
            << " -> " << estimateBigO(avgRatio) << std::endl;
    }
    out << std::defaultfloat;
}
