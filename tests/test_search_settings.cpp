#include <doctest/doctest.h>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include "SearchSettings.h"

namespace {

std::string tempPath(const char* name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

}

TEST_CASE("Settings/Defaults") {
    SearchSettings settings;
    CHECK(settings.gridWidth == 8);
    CHECK(settings.gridHeight == 8);
    CHECK(settings.algorithm == SearchSettings::Algos::AStar);
    CHECK(settings.seed == -1);
    CHECK(settings.maxStepsPerUpdate == 2000);
    CHECK(settings.stepDelaySeconds == doctest::Approx(0.03f));
}

TEST_CASE("Settings/ParseAlgo") {
    SearchSettings::Algos algo = SearchSettings::Algos::AStar;
    CHECK(SearchSettings::parseAlgo("bfs", algo));
    CHECK(algo == SearchSettings::Algos::BFS);
    CHECK(SearchSettings::parseAlgo(" A* ", algo));
    CHECK(algo == SearchSettings::Algos::AStar);
    CHECK(SearchSettings::parseAlgo("BFS", algo));
    CHECK(SearchSettings::parseAlgo("AStar", algo));
    CHECK(algo == SearchSettings::Algos::AStar);
    CHECK_FALSE(SearchSettings::parseAlgo("dijkstra", algo));
    CHECK(algo == SearchSettings::Algos::AStar);

    CHECK(SearchSettings::isExplorer(SearchSettings::Algos::BFS));
    CHECK(SearchSettings::isPathfinder(SearchSettings::Algos::AStar));
}

TEST_CASE("Settings/SaveAndLoad") {
    const std::string filename = tempPath("gridpath_settings_test.txt");

    SearchSettings saved;
    saved.gridWidth = 40;
    saved.gridHeight = 25;
    saved.tileOffset = 2.0f;
    saved.stepDelaySeconds = 0.5f;
    saved.maxStepsPerUpdate = 64;
    saved.blockDensity = 0.45f;
    saved.maxGenerateAttempts = 17;
    saved.seed = 1234;
    saved.algorithm = SearchSettings::Algos::BFS;
    saved.windowWidth = 1280;
    saved.windowHeight = 720;
    REQUIRE(saved.saveToFile(filename));

    SearchSettings loaded;
    REQUIRE(loaded.loadFromFile(filename));
    CHECK(loaded.gridWidth == 40);
    CHECK(loaded.gridHeight == 25);
    CHECK(loaded.tileOffset == doctest::Approx(2.0f));
    CHECK(loaded.stepDelaySeconds == doctest::Approx(0.5f));
    CHECK(loaded.maxStepsPerUpdate == 64);
    CHECK(loaded.blockDensity == doctest::Approx(0.45f));
    CHECK(loaded.maxGenerateAttempts == 17);
    CHECK(loaded.seed == 1234);
    CHECK(loaded.algorithm == SearchSettings::Algos::BFS);
    CHECK(loaded.windowWidth == 1280);
    CHECK(loaded.windowHeight == 720);

    std::remove(filename.c_str());
}

TEST_CASE("Settings/LoadClampsAndSkipsBadLines") {
    const std::string filename = tempPath("gridpath_settings_clamp.txt");
    {
        std::ofstream file(filename);
        file << "# comment\n";
        file << "gridWidth=9999\n";
        file << "gridHeight=0\n";
        file << "blockDensity=1.7\n";
        file << "stepDelaySeconds=abc\n";
        file << "maxStepsPerUpdate=99999999999999\n";
        file << "algorithm=greedy\n";
        file << "no equals sign here\n";
        file << "unknownKey=5\n";
    }

    SearchSettings settings;
    REQUIRE(settings.loadFromFile(filename));
    CHECK(settings.gridWidth == 512);
    CHECK(settings.gridHeight == 1);
    CHECK(settings.blockDensity == doctest::Approx(1.0f));
    CHECK(settings.stepDelaySeconds == doctest::Approx(0.03f));
    CHECK(settings.maxStepsPerUpdate == 2000);
    CHECK(settings.algorithm == SearchSettings::Algos::AStar);

    std::remove(filename.c_str());
}

TEST_CASE("Settings/MissingFile") {
    SearchSettings settings;
    CHECK_FALSE(settings.loadFromFile(tempPath("gridpath_does_not_exist.txt")));
    CHECK(settings.gridWidth == 8);
}

TEST_CASE("Settings/ValidateAndClamp") {
    SearchSettings settings;
    settings.tileOffset = -4.0f;
    settings.maxGenerateAttempts = 0;
    settings.seed = -20;
    settings.windowWidth = 50;
    settings.windowHeight = 10000;
    settings.validateAndClamp();

    CHECK(settings.tileOffset == doctest::Approx(0.0f));
    CHECK(settings.maxGenerateAttempts == 1);
    CHECK(settings.seed == -1);
    CHECK(settings.windowWidth == 200);
    CHECK(settings.windowHeight == 4096);
}
