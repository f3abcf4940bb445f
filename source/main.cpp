#include <SFML/Graphics.hpp>
#include <SFML/Window.hpp>
#include <SFML/System.hpp>
#include <iostream>
#include <optional>
#include <string>

#include "SearchSettings.h"
#include "GridBoard.h"
#include "GridLayout.h"
#include "GridView.h"
#include "Pathfinder.h"
#include "SearchRunner.h"
#include "UIManager.h"

// tile edge before shrinking to fit the window
const float BASE_TILE_SIDE = 96.0f;
const float WINDOW_MARGIN = 10.0f;

const char *SETTINGS_FILE = "gridpath_settings.txt";

std::optional<unsigned> seedFromSettings(const SearchSettings &settings)
{
    if (settings.seed < 0)
        return std::nullopt;
    return static_cast<unsigned>(settings.seed);
}

std::string clickHint(const GridBoard &board)
{
    if (board.getClickStage() == GridBoard::ClickStage::PickStart)
        return "Left click: choose the start cell";
    return "Left click: choose the end cell";
}

int main(int argc, char **argv)
{
    SearchSettings settings;
    std::string settingsFile = argc > 1 ? argv[1] : SETTINGS_FILE;
    if (argc > 1 && !settings.loadFromFile(settingsFile))
    {
        std::cout << "Warning: using default settings" << std::endl;
    }

    sf::RenderWindow window(sf::VideoMode({static_cast<unsigned>(settings.windowWidth),
                                           static_cast<unsigned>(settings.windowHeight)}),
                            "GridPath");
    window.setFramerateLimit(60);

    // initialize font
    sf::Font font;
    if (!font.openFromFile("DejaVuSans.ttf") &&
        !font.openFromFile("bin/DejaVuSans.ttf") &&
        !font.openFromFile("source/DejaVuSans.ttf") &&
        !font.openFromFile("/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf"))
    {
        std::cout << "Warning: Could not load font file, HUD text may not display properly" << std::endl;
    }

    GridBoard board(settings.gridWidth, settings.gridHeight);
    Pathfinder pathfinder;
    SearchRunner runner;
    GridView view;
    UIManager ui(font);

    runner.setStepDelay(settings.stepDelaySeconds);
    runner.setMaxStepsPerUpdate(settings.maxStepsPerUpdate);

    auto relayout = [&]()
    {
        sf::Vector2f size = static_cast<sf::Vector2f>(window.getSize());
        float top = ui.getHudHeight();
        view.setLayout(GridLayout::compute(board.getWidth(), board.getHeight(),
                                           WINDOW_MARGIN, top,
                                           size.x - 2.0f * WINDOW_MARGIN, size.y - top - WINDOW_MARGIN,
                                           BASE_TILE_SIDE, settings.tileOffset));
    };

    auto rebuildBoard = [&]()
    {
        runner.cancel();
        board.resize(settings.gridWidth, settings.gridHeight);
        view.resetForBoard(board);
        relayout();
    };

    // any edit invalidates the current run and its paint
    auto cancelRun = [&]()
    {
        runner.cancel();
        view.clearPainted();
    };

    view.resetForBoard(board);
    relayout();

    SearchStatus reportedStatus = SearchStatus::Idle;

    ui.onRunSearch = [&]()
    {
        cancelRun();
        SearchEngine &engine = pathfinder.getEngine(settings.algorithm);
        engine.setListener(view.makeListener());
        runner.setStepDelay(settings.stepDelaySeconds);
        runner.setMaxStepsPerUpdate(settings.maxStepsPerUpdate);
        if (!runner.start(engine, board.getGrid(), board.getStartCell(), board.getEndCell()))
        {
            std::cout << "Select a start and an end cell first" << std::endl;
            return;
        }
        reportedStatus = SearchStatus::Running;
        std::cout << "Running " << SearchSettings::algoNames(settings.algorithm) << std::endl;
    };

    ui.onCancelSearch = [&]()
    {
        if (runner.isRunning())
            std::cout << "Search cancelled" << std::endl;
        runner.cancel();
    };

    ui.onGenerateBlocks = [&]()
    {
        cancelRun();
        if (!board.getStartCell() || !board.getEndCell())
        {
            std::cout << "Select a start and an end cell before generating blocks" << std::endl;
            return;
        }
        if (board.randomizeBlocksEnsuringPath(settings.blockDensity, settings.maxGenerateAttempts,
                                              seedFromSettings(settings)))
        {
            std::cout << "Generated " << board.getGrid().countBlocked() << " blocks" << std::endl;
        }
        else
        {
            std::cout << "No solvable layout within " << settings.maxGenerateAttempts
                      << " attempts, board unchanged" << std::endl;
        }
    };

    ui.onClearBlocks = [&]()
    {
        cancelRun();
        board.clearBlocks();
    };

    ui.onPacingChanged = [&]()
    {
        runner.setStepDelay(settings.stepDelaySeconds);
    };

    ui.onSaveSettings = [&]()
    {
        if (settings.saveToFile(settingsFile))
            std::cout << "Settings saved to " << settingsFile << std::endl;
    };

    ui.onLoadSettings = [&]()
    {
        if (settings.loadFromFile(settingsFile))
        {
            std::cout << "Settings loaded from " << settingsFile << std::endl;
            rebuildBoard();
        }
    };

    sf::Clock clock;

    while (window.isOpen())
    {
        sf::Time deltaTime = clock.restart();

        // handle events
        while (const std::optional event = window.pollEvent())
        {
            if (event->is<sf::Event::Closed>())
            {
                window.close();
            }

            if (const auto *resized = event->getIf<sf::Event::Resized>())
            {
                sf::Vector2f size = static_cast<sf::Vector2f>(resized->size);
                window.setView(sf::View(sf::FloatRect({0.0f, 0.0f}, size)));
                relayout();
            }

            if (const auto *keyPressed = event->getIf<sf::Event::KeyPressed>())
            {
                ui.handleInput(keyPressed, settings);
            }

            if (const auto *mouse = event->getIf<sf::Event::MouseButtonPressed>())
            {
                sf::Vector2f point = window.mapPixelToCoords(mouse->position);
                std::optional<GridCell> cell = view.getLayout().cellAt(point.x, point.y);
                if (!cell)
                    continue;

                cancelRun();
                if (mouse->button == sf::Mouse::Button::Left)
                {
                    if (!board.selectCell(cell->x, cell->y))
                        std::cout << "Cell (" << cell->x << "," << cell->y << ") is blocked" << std::endl;
                }
                else if (mouse->button == sf::Mouse::Button::Right)
                {
                    board.toggleBlock(cell->x, cell->y);
                }
            }
        }

        runner.update(deltaTime.asSeconds());

        SearchEngine *engine = runner.getEngine();
        if (engine != nullptr)
        {
            view.revealPath(engine->getPath(), runner.getRevealedPathLength());

            // log each outcome once
            if (engine->getStatus() != reportedStatus && !engine->isRunning())
            {
                reportedStatus = engine->getStatus();
                std::cout << engine->getName() << ": " << searchStatusName(reportedStatus)
                          << " | explored " << engine->getExploredCount();
                if (reportedStatus == SearchStatus::Found)
                    std::cout << " | path length " << engine->getPath().size() - 1;
                std::cout << std::endl;
            }
            if (engine->isRunning())
                reportedStatus = SearchStatus::Running;
        }

        window.clear(sf::Color(30, 30, 30));
        view.draw(window, board);

        HudStatus status;
        status.engine = engine;
        status.revealedPathLength = runner.getRevealedPathLength();
        status.hint = clickHint(board);
        ui.drawHUD(window, settings, status);

        window.display();
    }

    return 0;
}
