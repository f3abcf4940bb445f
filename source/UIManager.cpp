#include "UIManager.h"
#include <sstream>
#include <iomanip>
#include <iostream>
#include <algorithm>

UIManager::UIManager(sf::Font &font) : font_(font) {}

void UIManager::handleInput(const sf::Event::KeyPressed *keyEvent, SearchSettings &settings)
{
    if (keyEvent)
    {
        handleKeyboardInput(keyEvent->code, settings);
    }
}

void UIManager::drawHUD(sf::RenderWindow &window, const SearchSettings &settings, const HudStatus &status)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    oss << "Algorithm [Tab]: " << SearchSettings::algoNames(settings.algorithm)
        << " (" << SearchSettings::algoCategory(settings.algorithm) << ")";
    oss << "  |  Grid: " << settings.gridWidth << "x" << settings.gridHeight << "\n";

    if (status.engine != nullptr)
    {
        oss << "Status: " << searchStatusName(status.engine->getStatus())
            << "  |  Explored: " << status.engine->getExploredCount()
            << "  |  Path: ";
        if (status.engine->getStatus() == SearchStatus::Found)
        {
            int moves = static_cast<int>(status.engine->getPath().size()) - 1;
            int shown = std::min(status.revealedPathLength, moves + 1);
            oss << (shown > 0 ? shown - 1 : 0) << "/" << moves;
        }
        else
        {
            oss << "--";
        }
        oss << "\n";
    }
    else
    {
        oss << "Status: " << searchStatusName(SearchStatus::Idle) << "\n";
    }

    oss << "Step Delay [[/]]: " << std::setprecision(3) << settings.stepDelaySeconds << "s"
        << "  |  Density [+/-]: " << std::setprecision(2) << settings.blockDensity << "\n";
    if (!status.hint.empty())
        oss << status.hint << "\n";
    oss << "[Space] Run | [B] BFS | [A] A* | [G] Generate | [C] Clear | [Esc] Cancel | [H] Help";

    sf::Text text(font_, oss.str(), 14);
    text.setFillColor(hudTextColor_);
    text.setOutlineColor(sf::Color::Black);
    text.setOutlineThickness(1.5f);
    text.setPosition({10.0f, 10.0f});

    // draw background
    sf::FloatRect textBounds = text.getLocalBounds();
    drawBackground(window, sf::FloatRect({5, 5}, {textBounds.size.x + 10, textBounds.size.y + 10}));
    hudHeight_ = std::max(hudHeight_, textBounds.size.y + 25.0f);

    window.draw(text);

    if (showHelp_)
        drawHelpText(window);
}

void UIManager::drawHelpText(sf::RenderWindow &window)
{
    std::ostringstream oss;
    oss << "=== Controls ===" << "\n";
    oss << "Left click: pick start, then end" << "\n";
    oss << "Right click: toggle a block" << "\n";
    oss << "[Space] run selected algorithm" << "\n";
    oss << "[B] / [A] run BFS / A*" << "\n";
    oss << "[Tab] switch algorithm" << "\n";
    oss << "[G] random blocks keeping a path" << "\n";
    oss << "[C] clear blocks" << "\n";
    oss << "[+/-] block density" << "\n";
    oss << "[[/]] step delay" << "\n";
    oss << "[Esc] cancel the run" << "\n";
    oss << "[S] Save | [L] Load Settings";

    sf::Text text(font_, oss.str(), 14);
    text.setFillColor(hudAccentColor_);
    text.setOutlineColor(sf::Color::Black);
    text.setOutlineThickness(1.0f);

    sf::Vector2f windowSize = static_cast<sf::Vector2f>(window.getSize());
    sf::FloatRect textBounds = text.getLocalBounds();
    sf::Vector2f pos(windowSize.x - textBounds.size.x - 20.0f, 10.0f);
    text.setPosition(pos);

    drawBackground(window, sf::FloatRect({pos.x - 5, pos.y - 5}, {textBounds.size.x + 10, textBounds.size.y + 10}));
    window.draw(text);
}

void UIManager::selectAndRun(SearchSettings &settings, SearchSettings::Algos algo)
{
    settings.algorithm = algo;
    if (onRunSearch)
        onRunSearch();
}

void UIManager::handleKeyboardInput(sf::Keyboard::Key key, SearchSettings &settings)
{
    const float densityStep = 0.05f;
    const float delayStep = 0.01f;

    switch (key)
    {
    // algorithm selection
    case sf::Keyboard::Key::B:
        selectAndRun(settings, SearchSettings::Algos::BFS);
        break;
    case sf::Keyboard::Key::A:
        selectAndRun(settings, SearchSettings::Algos::AStar);
        break;
    case sf::Keyboard::Key::Tab:
        settings.algorithm = settings.algorithm == SearchSettings::Algos::BFS
                                 ? SearchSettings::Algos::AStar
                                 : SearchSettings::Algos::BFS;
        std::cout << "Algorithm: " << SearchSettings::algoNames(settings.algorithm) << std::endl;
        break;

    // actions
    case sf::Keyboard::Key::Space:
        if (onRunSearch)
            onRunSearch();
        break;
    case sf::Keyboard::Key::Escape:
        if (onCancelSearch)
            onCancelSearch();
        break;
    case sf::Keyboard::Key::G:
        if (onGenerateBlocks)
            onGenerateBlocks();
        break;
    case sf::Keyboard::Key::C:
        if (onClearBlocks)
            onClearBlocks();
        break;

    // block density
    case sf::Keyboard::Key::Equal:
    case sf::Keyboard::Key::Add:
        adjustParameter(settings.blockDensity, densityStep, 0.0f, 1.0f);
        break;
    case sf::Keyboard::Key::Hyphen:
    case sf::Keyboard::Key::Subtract:
        adjustParameter(settings.blockDensity, -densityStep, 0.0f, 1.0f);
        break;

    // step delay
    case sf::Keyboard::Key::RBracket:
        adjustParameter(settings.stepDelaySeconds, delayStep, 0.0f, 2.0f);
        if (onPacingChanged)
            onPacingChanged();
        break;
    case sf::Keyboard::Key::LBracket:
        adjustParameter(settings.stepDelaySeconds, -delayStep, 0.0f, 2.0f);
        if (onPacingChanged)
            onPacingChanged();
        break;

    case sf::Keyboard::Key::H:
        showHelp_ = !showHelp_;
        break;
    case sf::Keyboard::Key::S:
        if (onSaveSettings)
            onSaveSettings();
        break;
    case sf::Keyboard::Key::L:
        if (onLoadSettings)
            onLoadSettings();
        break;

    default:
        break;
    }
}

void UIManager::adjustParameter(float &param, float delta, float min, float max)
{
    param = std::clamp(param + delta, min, max);
}

void UIManager::drawBackground(sf::RenderWindow &window, const sf::FloatRect &bounds)
{
    sf::RectangleShape background(sf::Vector2f(bounds.size.x, bounds.size.y));
    background.setPosition({bounds.position.x, bounds.position.y});
    background.setFillColor(hudBackgroundColor_);
    background.setOutlineThickness(1.0f);
    background.setOutlineColor(sf::Color(100, 100, 100));
    window.draw(background);
}
