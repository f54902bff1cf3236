/**
 * @file renderer.hpp
 * @brief Graphics rendering using SFML
 *
 * Draws the container outline, the ball and the overlay text. Knows
 * nothing about the ECS: it only consumes a RenderState snapshot.
 */

#ifndef HEXBALL_RENDERER_H
#define HEXBALL_RENDERER_H

#include <string>
#include <SFML/Graphics.hpp>

#include "hexball/components/basic.hpp"
#include "hexball/core/simulator.hpp"

class Renderer {
public:
    /**
     * @brief Constructs renderer with specified screen dimensions
     * @param screenWidth Width of render window in pixels
     * @param screenHeight Height of render window in pixels
     */
    Renderer(int screenWidth, int screenHeight);
    ~Renderer();

    /**
     * @brief Opens the SFML window and loads a font
     *
     * A missing font is not fatal; text is simply not drawn.
     *
     * @return true if the window opened, false otherwise
     */
    bool init();

    /** @brief Clears screen to black */
    void clear();

    /** @brief Presents rendered frame to screen */
    void present();

    /**
     * @brief Draws the container as a closed outline and the ball as a disc
     */
    void renderScene(const RenderState& state);

    /**
     * @brief Renders FPS counter below the banner
     * @param fps Current frames per second
     */
    void renderFPS(float fps);

    /**
     * @brief Renders text at specified position
     * @param text String to render
     * @param x X coordinate in pixels
     * @param y Y coordinate in pixels
     * @param color Text color (defaults to white)
     */
    void renderText(const std::string& text, int x, int y, sf::Color color = sf::Color::White);

    /** @brief Access to underlying SFML window */
    sf::RenderWindow& getWindow() { return window; }

private:
    sf::RenderWindow window;
    sf::Font font;
    bool fontLoaded;
    int screenWidth;
    int screenHeight;
};

#endif // HEXBALL_RENDERER_H
