#pragma once
#include <SFML/Graphics.hpp>
#include "SearchSettings.h"
#include "SearchEngine.h"
#include <functional>
#include <string>

// what the hud shows about the current run
struct HudStatus
{
    const SearchEngine *engine = nullptr; // null before the first run
    int revealedPathLength = 0;
    std::string hint;                     // one line prompt, e.g. which click comes next
};

class UIManager
{
public:
    UIManager(sf::Font &font);

    // event handling
    void handleInput(const sf::Event::KeyPressed *keyEvent, SearchSettings &settings);

    // rendering
    void drawHUD(sf::RenderWindow &window, const SearchSettings &settings, const HudStatus &status);
    float getHudHeight() const { return hudHeight_; }

    bool isHelpOpen() const { return showHelp_; }

    // callbacks for search control
    std::function<void()> onRunSearch;
    std::function<void()> onCancelSearch;
    std::function<void()> onGenerateBlocks;
    std::function<void()> onClearBlocks;
    std::function<void()> onPacingChanged;
    std::function<void()> onSaveSettings;
    std::function<void()> onLoadSettings;

private:
    sf::Font &font_;
    bool showHelp_ = false;
    float hudHeight_ = 110.0f;

    // ui styling
    sf::Color hudBackgroundColor_ = sf::Color(0, 0, 0, 150);
    sf::Color hudTextColor_ = sf::Color::White;
    sf::Color hudAccentColor_ = sf::Color::Yellow;

    // parameter adjustment
    void adjustParameter(float &param, float delta, float min, float max);

    // ui drawing helpers
    void drawBackground(sf::RenderWindow &window, const sf::FloatRect &bounds);
    void drawHelpText(sf::RenderWindow &window);

    void handleKeyboardInput(sf::Keyboard::Key key, SearchSettings &settings);
    void selectAndRun(SearchSettings &settings, SearchSettings::Algos algo);
};
