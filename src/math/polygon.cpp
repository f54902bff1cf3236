#include "hexball/math/polygon.hpp"

#include <cmath>

#include "hexball/core/constants.hpp"

std::vector<Vector> regularPolygonVertices(const Position &center,
                                           double circumradius,
                                           int sides,
                                           double angle) {
    std::vector<Vector> vertices;
    if (sides <= 0) {
        return vertices;
    }
    vertices.reserve(static_cast<std::size_t>(sides));

    double const step = 2.0 * SimulatorConstants::Pi / sides;
    for (int i = 0; i < sides; ++i) {
        double const a = angle + step * i;
        vertices.emplace_back(center.x + circumradius * std::cos(a),
                              center.y + circumradius * std::sin(a));
    }
    return vertices;
}

Vector pointVelocityOnRotatingBody(const Vector &point,
                                   const Position &center,
                                   double omega) {
    Vector const r = point - Vector(center);
    return {-omega * r.y, omega * r.x};
}
