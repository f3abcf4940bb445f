#include "SearchSettings.h"
#include <fstream>
#include <iostream>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace
{
std::string trim(const std::string &text)
{
    size_t first = text.find_first_not_of(" \t\r");
    if (first == std::string::npos)
        return "";
    size_t last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}
}

bool SearchSettings::parseAlgo(const std::string &text, Algos &out)
{
    std::string lower = trim(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "bfs" || lower == "0")
    {
        out = Algos::BFS;
        return true;
    }
    if (lower == "astar" || lower == "a*" || lower == "1")
    {
        out = Algos::AStar;
        return true;
    }
    return false;
}

bool SearchSettings::saveToFile(const std::string &filename) const
{
    std::ofstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Error: Could not open file for writing: " << filename << std::endl;
        return false;
    }

    file << "# GridPath Settings\n";
    file << "gridWidth=" << gridWidth << "\n";
    file << "gridHeight=" << gridHeight << "\n";
    file << "tileOffset=" << tileOffset << "\n";
    file << "stepDelaySeconds=" << stepDelaySeconds << "\n";
    file << "maxStepsPerUpdate=" << maxStepsPerUpdate << "\n";
    file << "blockDensity=" << blockDensity << "\n";
    file << "maxGenerateAttempts=" << maxGenerateAttempts << "\n";
    file << "seed=" << seed << "\n";
    file << "algorithm=" << (algorithm == Algos::BFS ? "bfs" : "astar") << "\n";
    file << "windowWidth=" << windowWidth << "\n";
    file << "windowHeight=" << windowHeight << "\n";

    if (!file.good())
    {
        std::cerr << "Error: Failed writing settings to: " << filename << std::endl;
        return false;
    }
    return true;
}

bool SearchSettings::loadFromFile(const std::string &filename)
{
    std::ifstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Error: Could not open file for reading: " << filename << std::endl;
        return false;
    }

    std::string line;
    int lineNumber = 0;
    while (std::getline(file, line))
    {
        lineNumber++;
        line = trim(line);
        if (line.empty() || line[0] == '#')
            continue;

        size_t equalPos = line.find('=');
        if (equalPos == std::string::npos)
            continue;

        std::string key = trim(line.substr(0, equalPos));
        std::string value = trim(line.substr(equalPos + 1));

        try
        {
            if (key == "gridWidth")
                gridWidth = std::stoi(value);
            else if (key == "gridHeight")
                gridHeight = std::stoi(value);
            else if (key == "tileOffset")
                tileOffset = std::stof(value);
            else if (key == "stepDelaySeconds")
                stepDelaySeconds = std::stof(value);
            else if (key == "maxStepsPerUpdate")
                maxStepsPerUpdate = std::stoi(value);
            else if (key == "blockDensity")
                blockDensity = std::stof(value);
            else if (key == "maxGenerateAttempts")
                maxGenerateAttempts = std::stoi(value);
            else if (key == "seed")
                seed = std::stoi(value);
            else if (key == "algorithm")
            {
                if (!parseAlgo(value, algorithm))
                    std::cerr << "Error: " << filename << ":" << lineNumber
                              << ": unknown algorithm '" << value << "'" << std::endl;
            }
            else if (key == "windowWidth")
                windowWidth = std::stoi(value);
            else if (key == "windowHeight")
                windowHeight = std::stoi(value);
        }
        catch (const std::invalid_argument &)
        {
            std::cerr << "Error: " << filename << ":" << lineNumber
                      << ": bad value for " << key << ": '" << value << "'" << std::endl;
        }
        catch (const std::out_of_range &)
        {
            std::cerr << "Error: " << filename << ":" << lineNumber
                      << ": value out of range for " << key << ": '" << value << "'" << std::endl;
        }
    }

    validateAndClamp();
    return true;
}

void SearchSettings::validateAndClamp()
{
    gridWidth = std::clamp(gridWidth, 1, 512);
    gridHeight = std::clamp(gridHeight, 1, 512);
    tileOffset = std::clamp(tileOffset, 0.0f, 64.0f);
    stepDelaySeconds = std::clamp(stepDelaySeconds, 0.0f, 2.0f);
    maxStepsPerUpdate = std::clamp(maxStepsPerUpdate, 1, 1000000);
    blockDensity = std::clamp(blockDensity, 0.0f, 1.0f);
    maxGenerateAttempts = std::clamp(maxGenerateAttempts, 1, 10000);
    seed = std::max(-1, seed);
    windowWidth = std::clamp(windowWidth, 200, 4096);
    windowHeight = std::clamp(windowHeight, 200, 4096);
}
