#ifndef HEXBALL_COMPONENTS_BASIC_HPP
#define HEXBALL_COMPONENTS_BASIC_HPP

#include <cstdint>
#include "hexball/math/vector_math.hpp" // for Position, Vector

namespace Components {

    // Use the Position and Vector classes from vector_math.hpp
    using Position = ::Position;
    using Velocity = ::Vector;

    // Ball radius, in pixels
    struct Radius {
        double value;
    };

    // Regular polygon outline. The entity's Position is the rotation center.
    struct RegularPolygon {
        double circumradius;
        int sides;
    };

    // Angular components
    struct AngularPosition {
        double angle; // radians, unbounded
    };

    struct AngularVelocity {
        double omega; // radians per second
    };

    struct Color {
        uint8_t r, g, b;
        Color(uint8_t r = 255, uint8_t g = 255, uint8_t b = 255)
            : r(r), g(g), b(b) {}
    };

    // Tags
    struct Ball {};
    struct Container {};

} // namespace Components

#endif // HEXBALL_COMPONENTS_BASIC_HPP
