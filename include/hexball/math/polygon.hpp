/**
 * @file polygon.hpp
 * @brief Regular polygon geometry for the rotating container
 *
 * The container's vertices are never stored. They are derived from the
 * current rotation angle every time they are needed:
 *
 *   vertex[i] = center + R * (cos(angle + 2*pi*i/n), sin(angle + 2*pi*i/n))
 *
 * so the polygon always stays a rigid, regular n-gon. Edge i runs from
 * vertex[i] to vertex[(i+1) % n].
 */

#ifndef HEXBALL_POLYGON_HPP
#define HEXBALL_POLYGON_HPP

#include <cstddef>
#include <utility>
#include <vector>

#include "hexball/math/vector_math.hpp"

/**
 * @brief Computes the world-space vertices of a regular polygon
 *
 * @param center Rotation center of the polygon
 * @param circumradius Distance from center to each vertex
 * @param sides Number of vertices (n >= 3)
 * @param angle Current rotation angle in radians
 * @return std::vector<Vector> n vertices ordered by increasing angle
 */
std::vector<Vector> regularPolygonVertices(const Position &center,
                                           double circumradius,
                                           int sides,
                                           double angle);

/**
 * @brief Returns edge i of a vertex loop as (start, end)
 */
inline std::pair<Vector, Vector> polygonEdge(const std::vector<Vector> &vertices,
                                             std::size_t i) {
    return {vertices[i], vertices[(i + 1) % vertices.size()]};
}

/**
 * @brief Linear velocity of a point rigidly attached to a rotating body
 *
 * omega x r for a rotation about center, with r = point - center.
 *
 * @param point World position of the point
 * @param center Rotation center
 * @param omega Angular speed in radians per second
 * @return Vector (-omega * r.y, omega * r.x)
 */
Vector pointVelocityOnRotatingBody(const Vector &point,
                                   const Position &center,
                                   double omega);

#endif // HEXBALL_POLYGON_HPP
