/**
 * @file sim_manager.cpp
 * @brief Implementation of SimManager, which drives the window loop.
 */

#include <iostream>
#include <memory>
#include <utility>

#include <SFML/System/Clock.hpp>
#include <SFML/Window/Event.hpp>

#include "hexball/core/constants.hpp"
#include "hexball/core/profile.hpp"
#include "hexball/core/sim_manager.hpp"

namespace {

// Used as dt when stepping a single frame while paused
constexpr double kSingleStepSeconds = 1.0 / 60.0;

}  // namespace

SimManager::SimManager(RotatingHexagonConfig config)
    : renderer(SimulatorConstants::ScreenWidth, SimulatorConstants::ScreenHeight)
    , simulator()
    , scenarioConfig(std::move(config))
    , running(true)
    , paused(false)
    , stepFrame(false)
{
}

bool SimManager::init()
{
    if (!renderer.init())
    {
        std::cerr << "Renderer initialization failed." << std::endl;
        return false;
    }

    simulator.loadScenario(std::make_unique<RotatingHexagonScenario>(scenarioConfig));
    return true;
}

void SimManager::run()
{
    sf::Clock frameClock;
    float fps = 0.0f;

    while (running && renderer.getWindow().isOpen())
    {
        double const frameSeconds = frameClock.restart().asSeconds();
        if (frameSeconds > 0.0)
        {
            // Smoothed so the overlay is readable
            fps = 0.9f * fps + 0.1f * static_cast<float>(1.0 / frameSeconds);
        }

        if (!handleEvents())
        {
            break;
        }
        tick(frameSeconds);
        render(fps);
    }

    renderer.getWindow().close();
}

bool SimManager::handleEvents()
{
    sf::RenderWindow& window = renderer.getWindow();

    sf::Event event;
    while (window.pollEvent(event))
    {
        if (event.type == sf::Event::Closed)
        {
            running = false;
        }
        else if (event.type == sf::Event::KeyPressed)
        {
            switch (event.key.code)
            {
                case sf::Keyboard::Escape:
                    running = false;
                    break;
                case sf::Keyboard::P:
                    togglePause();
                    break;
                case sf::Keyboard::Space:
                    if (paused)
                    {
                        stepOnce();
                    }
                    break;
                case sf::Keyboard::R:
                    resetSimulator();
                    break;
                case sf::Keyboard::Num1:
                    setTimeScale(0.25);
                    break;
                case sf::Keyboard::Num2:
                    setTimeScale(0.5);
                    break;
                case sf::Keyboard::Num3:
                    setTimeScale(1.0);
                    break;
                default:
                    break;
            }
        }
    }

    return running;
}

void SimManager::tick(double frameSeconds)
{
    PROFILE_SCOPE("SimManager::tick");

    if (paused && !stepFrame)
    {
        return;
    }

    double const dt = stepFrame ? kSingleStepSeconds : frameSeconds;
    simulator.step(dt * simulator.getTimeScale());
    stepFrame = false;
}

void SimManager::render(float fps)
{
    PROFILE_SCOPE("SimManager::render");

    renderer.clear();
    renderer.renderScene(simulator.getRenderState());
    renderer.renderText(SimulatorConstants::BannerText, 10, 10);
    renderer.renderFPS(fps);
    if (paused)
    {
        renderer.renderText("Paused", 10, 50, sf::Color::Yellow);
    }
    renderer.present();
}

void SimManager::togglePause()
{
    paused = !paused;
}

void SimManager::resetSimulator()
{
    simulator.reset();
    paused = false;
}

void SimManager::stepOnce()
{
    stepFrame = true;
}

void SimManager::setTimeScale(double multiplier)
{
    simulator.setTimeScale(multiplier);
}
