/**
 * @file vector_math.hpp
 * @brief 2D vector and position mathematics
 *
 * Provides the geometric primitives used by the integrator and the
 * container collision system:
 * - Vector class for velocities, normals and offsets
 * - Position class for point locations in 2D space
 * - Segment projection helper
 */

#ifndef HEXBALL_VECTOR_MATH_HPP
#define HEXBALL_VECTOR_MATH_HPP

// Forward declarations
class Vector;

/**
 * @brief Constants for floating-point comparisons
 */
constexpr double EPSILON = 1e-9;  ///< Threshold for approximate equality tests

/**
 * @brief Compares two doubles for approximate equality
 *
 * @param a First value
 * @param b Second value
 * @param epsilon Maximum allowed difference
 * @return true if |a-b| < epsilon
 */
bool nearlyEqual(double a, double b, double epsilon=EPSILON);

/**
 * @brief Represents a 2D point in space
 *
 * Kept as a distinct type from Vector so that it can live next to
 * Velocity as its own ECS component.
 */
class Position {
public:
    double x;  ///< X coordinate (pixels)
    double y;  ///< Y coordinate (pixels, grows downward)

    /** @brief Constructs a Position at (0,0) */
    Position();

    /**
     * @brief Constructs a Position at specified coordinates
     * @param x X coordinate
     * @param y Y coordinate
     */
    Position(double x, double y);

    /**
     * @brief Constructs a Position from a vector's components
     * @param v Vector to convert
     */
    Position(const Vector& v);

    /**
     * @brief Offsets this position by a displacement
     * @param v Displacement
     * @return Reference to this position
     */
    Position& operator+=(const Vector& v);

    /**
     * @brief Calculates Euclidean distance to another position
     * @param p Target position
     * @return Distance between positions
     */
    double dist(const Position& p) const;
};

/**
 * @brief Represents a 2D vector with direction and magnitude
 */
class Vector {
public:
    double x;  ///< X component
    double y;  ///< Y component

    /** @brief Constructs a zero vector (0,0) */
    Vector();

    /**
     * @brief Constructs a vector with given components
     * @param x X component
     * @param y Y component
     */
    Vector(double x, double y);

    /**
     * @brief Constructs a vector from a position
     * @param p Position to convert
     */
    Vector(const Position& p);

    /** @brief Returns negation of this vector */
    Vector operator-() const;

    Vector operator+(const Vector& b) const;
    Vector operator-(const Vector& b) const;
    Vector operator*(double scalar) const;

    Vector& operator+=(const Vector& v);

    /** @brief Returns vector magnitude */
    double length() const;

    /** @brief Returns squared magnitude */
    double lengthSquared() const;

    /**
     * @brief Calculates dot product with another vector
     * @param v Other vector
     * @return Dot product value
     */
    double dotProduct(const Vector& v) const;

    /**
     * @brief Returns the perpendicular (-y, x)
     *
     * For an edge of a polygon whose vertices are listed by increasing
     * angle this points toward the interior.
     */
    Vector perp() const;

    /**
     * @brief Returns the unit vector in the same direction
     *
     * A zero-length vector normalizes to the zero vector, so callers that
     * need a direction must handle that case themselves.
     */
    Vector normalized() const;
};

/**
 * @brief Finds the closest point on segment ab to point p
 *
 * The projection parameter is clamped to [0,1]. A degenerate segment
 * returns a.
 *
 * @param a Start point of the segment
 * @param b End point of the segment
 * @param p Query point
 * @return Vector Closest point on ab
 */
Vector closestPointOnSegment(const Vector &a, const Vector &b, const Vector &p);

#endif // HEXBALL_VECTOR_MATH_HPP
