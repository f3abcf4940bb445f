#include <iostream>
#include <string>
#include <vector>
#include <optional>
#include <stdexcept>

#include "SearchSettings.h"
#include "GridBoard.h"
#include "GridIO.h"
#include "Pathfinder.h"
#include "BenchmarkManager.h"

// process exit codes
const int EXIT_FOUND = 0;
const int EXIT_NO_PATH = 1;
const int EXIT_BAD_REQUEST = 2;
const int EXIT_INTERNAL_ERROR = 3;

struct CliOptions
{
    std::string mapFile;
    std::string configFile;
    std::string saveConfigFile;
    std::optional<int> width;
    std::optional<int> height;
    std::optional<float> density;
    std::optional<int> seed;
    std::optional<GridCell> start;
    std::optional<GridCell> end;
    std::string algo = "both";
    bool trace = false;
    bool print = false;
    bool benchmark = false;
    bool help = false;
};

void printUsage(const char *program)
{
    std::cout << "Usage: " << program << " [options]\n"
              << "  --map FILE           load a map ('.' free, '#' blocked, 'S' start, 'E' end)\n"
              << "  --width W            width of a generated board\n"
              << "  --height H           height of a generated board\n"
              << "  --density D          block probability for generated boards (0..1)\n"
              << "  --seed N             seed for generated boards, -1 = random\n"
              << "  --start x,y          override the start cell\n"
              << "  --end x,y            override the end cell\n"
              << "  --algo bfs|astar|both\n"
              << "  --trace              print every explored cell\n"
              << "  --print              render the board with the path\n"
              << "  --config FILE        load settings\n"
              << "  --save-config FILE   write the effective settings\n"
              << "  --benchmark          run the empirical doubling experiment\n"
              << "  --help               show this message\n";
}

bool parseInt(const std::string &text, int &out)
{
    try
    {
        size_t used = 0;
        out = std::stoi(text, &used);
        return used == text.size();
    }
    catch (const std::invalid_argument &)
    {
        return false;
    }
    catch (const std::out_of_range &)
    {
        return false;
    }
}

bool parseFloat(const std::string &text, float &out)
{
    try
    {
        size_t used = 0;
        out = std::stof(text, &used);
        return used == text.size();
    }
    catch (const std::invalid_argument &)
    {
        return false;
    }
    catch (const std::out_of_range &)
    {
        return false;
    }
}

// "x,y"
bool parseCell(const std::string &text, GridCell &out)
{
    size_t comma = text.find(',');
    if (comma == std::string::npos)
        return false;
    return parseInt(text.substr(0, comma), out.x) && parseInt(text.substr(comma + 1), out.y);
}

bool parseArguments(int argc, char **argv, CliOptions &options)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        // flags without a value
        if (arg == "--trace")
        {
            options.trace = true;
            continue;
        }
        if (arg == "--print")
        {
            options.print = true;
            continue;
        }
        if (arg == "--benchmark")
        {
            options.benchmark = true;
            continue;
        }
        if (arg == "--help" || arg == "-h")
        {
            options.help = true;
            continue;
        }

        if (i + 1 >= argc)
        {
            std::cerr << "Error: missing value for " << arg << std::endl;
            return false;
        }
        std::string value = argv[++i];

        bool ok = true;
        if (arg == "--map")
            options.mapFile = value;
        else if (arg == "--config")
            options.configFile = value;
        else if (arg == "--save-config")
            options.saveConfigFile = value;
        else if (arg == "--algo")
            options.algo = value;
        else if (arg == "--width")
        {
            int v = 0;
            ok = parseInt(value, v);
            options.width = v;
        }
        else if (arg == "--height")
        {
            int v = 0;
            ok = parseInt(value, v);
            options.height = v;
        }
        else if (arg == "--density")
        {
            float v = 0.0f;
            ok = parseFloat(value, v);
            options.density = v;
        }
        else if (arg == "--seed")
        {
            int v = 0;
            ok = parseInt(value, v);
            options.seed = v;
        }
        else if (arg == "--start")
        {
            GridCell c{0, 0};
            ok = parseCell(value, c);
            options.start = c;
        }
        else if (arg == "--end")
        {
            GridCell c{0, 0};
            ok = parseCell(value, c);
            options.end = c;
        }
        else
        {
            std::cerr << "Error: unknown option " << arg << std::endl;
            return false;
        }

        if (!ok)
        {
            std::cerr << "Error: invalid value '" << value << "' for " << arg << std::endl;
            return false;
        }
    }
    return true;
}

// fills the board from --map or from the generation settings
bool prepareBoard(const CliOptions &options, const SearchSettings &settings, GridMap &map)
{
    if (!options.mapFile.empty())
    {
        if (!loadGridFromFile(options.mapFile, map))
            return false;
        if (options.start)
            map.start = options.start;
        if (options.end)
            map.end = options.end;
        return true;
    }

    GridBoard board(settings.gridWidth, settings.gridHeight);
    GridCell start = options.start.value_or(GridCell{0, 0});
    GridCell end = options.end.value_or(GridCell{settings.gridWidth - 1, settings.gridHeight - 1});
    if (!board.getGrid().inBounds(start) || !board.getGrid().inBounds(end))
    {
        // keep the endpoints so the search reports them as an invalid request
        map.grid = board.getGrid();
        map.start = start;
        map.end = end;
        return true;
    }
    board.setStartCell(start);
    board.setEndCell(end);

    std::optional<unsigned> seed;
    if (settings.seed >= 0)
        seed = static_cast<unsigned>(settings.seed);

    if (settings.blockDensity > 0.0f &&
        !board.randomizeBlocksEnsuringPath(settings.blockDensity, settings.maxGenerateAttempts, seed))
    {
        std::cout << "Warning: no solvable layout within " << settings.maxGenerateAttempts
                  << " attempts, using an empty board" << std::endl;
    }

    map.grid = board.getGrid();
    map.start = board.getStartCell();
    map.end = board.getEndCell();
    return true;
}

int exitCodeFor(SearchStatus status)
{
    switch (status)
    {
    case SearchStatus::Found:
        return EXIT_FOUND;
    case SearchStatus::NoPath:
        return EXIT_NO_PATH;
    case SearchStatus::InternalError:
        return EXIT_INTERNAL_ERROR;
    default:
        return EXIT_BAD_REQUEST;
    }
}

int runSearch(Pathfinder &pathfinder, SearchSettings::Algos algo, const GridMap &map, const CliOptions &options)
{
    SearchEngine &engine = pathfinder.getEngine(algo);

    std::vector<GridCell> explored;
    SearchListener listener;
    listener.onCellExplored = [&](const GridCell &cell)
    {
        explored.push_back(cell);
        if (options.trace)
            std::cout << "  explored (" << cell.x << "," << cell.y << ")" << std::endl;
    };
    engine.setListener(listener);

    PathResult result = pathfinder.findPath(algo, map.grid, map.start, map.end);
    engine.clearListener();

    std::cout << SearchSettings::algoNames(algo) << ": " << searchStatusName(result.status)
              << " | explored " << result.nodesExpanded
              << " | path length " << result.pathLength
              << " | " << result.computeTimeMs << " ms" << std::endl;

    if (result.status == SearchStatus::InvalidRequest)
        std::cerr << "Error: start and end must be inside the board and not blocked" << std::endl;

    if (options.print)
        std::cout << formatGridText(map.grid, map.start, map.end, result.path, explored);

    return exitCodeFor(result.status);
}

int main(int argc, char **argv)
{
    CliOptions options;
    if (!parseArguments(argc, argv, options))
    {
        printUsage(argv[0]);
        return EXIT_BAD_REQUEST;
    }
    if (options.help)
    {
        printUsage(argv[0]);
        return EXIT_FOUND;
    }

    SearchSettings settings;
    if (!options.configFile.empty() && !settings.loadFromFile(options.configFile))
        return EXIT_BAD_REQUEST;

    // command line wins over the config file
    if (options.width)
        settings.gridWidth = *options.width;
    if (options.height)
        settings.gridHeight = *options.height;
    if (options.density)
        settings.blockDensity = *options.density;
    if (options.seed)
        settings.seed = *options.seed;

    std::vector<SearchSettings::Algos> algos;
    if (options.algo == "both")
    {
        algos = {SearchSettings::Algos::BFS, SearchSettings::Algos::AStar};
    }
    else
    {
        SearchSettings::Algos algo;
        if (!SearchSettings::parseAlgo(options.algo, algo))
        {
            std::cerr << "Error: unknown algorithm '" << options.algo << "'" << std::endl;
            return EXIT_BAD_REQUEST;
        }
        settings.algorithm = algo;
        algos = {algo};
    }
    settings.validateAndClamp();

    if (!options.saveConfigFile.empty())
    {
        if (!settings.saveToFile(options.saveConfigFile))
            return EXIT_BAD_REQUEST;
        std::cout << "Settings saved to " << options.saveConfigFile << std::endl;
    }

    if (options.benchmark)
    {
        BenchmarkManager benchmark;
        std::optional<unsigned> seed;
        if (settings.seed >= 0)
            seed = static_cast<unsigned>(settings.seed);
        if (!benchmark.runDoublingExperiment(16, 6, 3, settings.blockDensity, seed))
            return EXIT_INTERNAL_ERROR;
        benchmark.printReport(std::cout);
        return EXIT_FOUND;
    }

    GridMap map;
    if (!prepareBoard(options, settings, map))
        return EXIT_BAD_REQUEST;

    std::cout << "Board " << map.grid.getWidth() << "x" << map.grid.getHeight()
              << ", " << map.grid.countBlocked() << " blocked" << std::endl;

    Pathfinder pathfinder;
    int exitCode = EXIT_FOUND;
    for (auto algo : algos)
    {
        int code = runSearch(pathfinder, algo, map, options);
        // the most severe outcome decides the exit code
        if (code > exitCode)
            exitCode = code;
    }
    return exitCode;
}
