#include "hexball/rendering/renderer.hpp"
#include "hexball/core/constants.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

sf::Color toSfColor(const Components::Color& c) {
    return sf::Color(c.r, c.g, c.b);
}

} // namespace

Renderer::Renderer(int screenWidth, int screenHeight)
    : window()
    , font()
    , fontLoaded(false)
    , screenWidth(screenWidth)
    , screenHeight(screenHeight)
{
}

Renderer::~Renderer() {}

bool Renderer::init() {
    window.create(sf::VideoMode(static_cast<unsigned int>(screenWidth),
                                static_cast<unsigned int>(screenHeight)),
                  SimulatorConstants::WindowTitle);
    if (!window.isOpen()) {
        std::cerr << "Failed to create " << screenWidth << "x" << screenHeight << " window\n";
        return false;
    }
    window.setFramerateLimit(SimulatorConstants::FrameRateLimit);

    for (unsigned int i = 0; i < SimulatorConstants::FontPathCount && !fontLoaded; ++i) {
        fontLoaded = font.loadFromFile(SimulatorConstants::FontPaths[i]);
    }
    if (!fontLoaded) {
        std::cerr << "No usable font found, on-screen text disabled\n";
    }

    return true;
}

void Renderer::clear() {
    window.clear(sf::Color::Black);
}

void Renderer::present() {
    window.display();
}

void Renderer::renderScene(const RenderState& state) {
    const auto& vertices = state.polygonVertices;
    if (!vertices.empty()) {
        // Closed outline: repeat the first vertex at the end
        sf::VertexArray outline(sf::LineStrip, vertices.size() + 1);
        sf::Color const color = toSfColor(state.containerColor);
        for (std::size_t i = 0; i <= vertices.size(); ++i) {
            const auto& v = vertices[i % vertices.size()];
            outline[i].position = sf::Vector2f(static_cast<float>(v.x), static_cast<float>(v.y));
            outline[i].color = color;
        }
        window.draw(outline);
    }

    if (state.ballRadius > 0.0) {
        float const r = static_cast<float>(state.ballRadius);
        sf::CircleShape circle(r);
        circle.setOrigin(r, r);
        circle.setPosition(static_cast<float>(state.ballPosition.x),
                           static_cast<float>(state.ballPosition.y));
        circle.setFillColor(toSfColor(state.ballColor));
        window.draw(circle);
    }
}

void Renderer::renderFPS(float fps) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(1) << fps << " FPS";
    renderText(ss.str(), 10, 30, sf::Color::White);
}

void Renderer::renderText(const std::string& text, int x, int y, sf::Color color) {
    if (!fontLoaded) {
        return;
    }
    sf::Text sfText;
    sfText.setFont(font);
    sfText.setString(text);
    sfText.setCharacterSize(16);
    sfText.setFillColor(color);
    sfText.setPosition(static_cast<float>(x), static_cast<float>(y));
    window.draw(sfText);
}
