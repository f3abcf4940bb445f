#pragma once
#include <string>

class SearchSettings
{
public:
    // algorithm categories:
    // EXPLORERS - uninformed, grow outward in rings until the goal turns up
    // PATHFINDERS - use a distance to goal heuristic to steer the search
    enum class Algos
    {
        BFS,   // breadth first search: shortest path by move count, no heuristic
        AStar, // A*: manhattan heuristic, explores a narrower region
    };

    static bool isExplorer(Algos a)
    {
        switch (a)
        {
        case Algos::BFS:
            return true;
        default:
            return false;
        }
    }

    static bool isPathfinder(Algos a)
    {
        return !isExplorer(a);
    }

    static const char *algoNames(Algos a)
    {
        switch (a)
        {
        case Algos::BFS:
            return "BFS";
        case Algos::AStar:
            return "A*";
        default:
            return "Unknown";
        }
    }

    static const char *algoCategory(Algos a)
    {
        return isExplorer(a) ? "Explorer" : "Pathfinder";
    }

    // accepts "bfs", "astar", "a*" (case insensitive)
    static bool parseAlgo(const std::string &text, Algos &out);

    // grid settings
    int gridWidth = 8;
    int gridHeight = 8;
    float tileOffset = 8.0f; // gap between tiles in pixels

    // search pacing: seconds between visualized steps, 0 = as fast as possible
    float stepDelaySeconds = 0.03f;
    int maxStepsPerUpdate = 2000; // step budget per frame when there is no delay

    // random obstacle generation
    float blockDensity = 0.3f;
    int maxGenerateAttempts = 200;
    int seed = -1; // -1 = nondeterministic

    Algos algorithm = Algos::AStar;

    // viewer window
    int windowWidth = 900;
    int windowHeight = 900;

    bool saveToFile(const std::string &filename) const;
    bool loadFromFile(const std::string &filename);

    void validateAndClamp();
};
