/**
 * @file container_collision.hpp
 * @brief Ball vs. rotating regular polygon collision detection and response
 *
 * The container walls move, so the response is computed in the rest frame
 * of the wall at the contact point:
 *
 *   v_wall    = omega x (P - center)
 *   rel       = v_ball - v_wall
 *   rel'      = rel - n * (1 + e) * dot(rel, n)      (only if dot(rel, n) < 0)
 *   v_ball'   = rel' + v_wall
 *   position += n * ((radius - dist) + margin)
 *
 * In ContactMode::EdgeAndEndpoints edges are visited in vertex order. For
 * each edge the segment contact is resolved first, then each endpoint as a
 * point contact. Every resolution mutates the ball before the next one is
 * examined, so the outcome depends on that order.
 *
 * In ContactMode::NearestFeature only the closest overlapping feature of the
 * whole polygon is resolved, once per tick.
 *
 * Required components:
 * - Ball: Position, Velocity, Radius, Ball tag
 * - Container: Position (center), RegularPolygon, AngularPosition,
 *   AngularVelocity, Container tag
 */

#ifndef HEXBALL_CONTAINER_COLLISION_HPP
#define HEXBALL_CONTAINER_COLLISION_HPP

#include <optional>
#include <vector>

#include <entt/entt.hpp>

#include "hexball/components/basic.hpp"
#include "hexball/components/sim.hpp"
#include "hexball/math/vector_math.hpp"
#include "hexball/systems/i_system.hpp"

namespace ContainerCollision {

/**
 * @brief A single overlap between the ball and a wall feature
 */
struct Contact {
    Vector point;     ///< Closest point on the wall feature
    Vector normal;    ///< Unit normal from the wall toward the ball center
    double distance;  ///< Distance from the ball center to point
    bool vertex = false;  ///< point is a polygon corner
};

/**
 * @brief Outcome of resolveContact
 */
enum class Response {
    Resolved,    ///< Velocity reflected and ball pushed out
    Separating   ///< Ball already leaving the wall; nothing changed
};

/**
 * @brief Tests the ball against segment ab
 *
 * If the ball center lies exactly on the segment the normal falls back to
 * the edge perpendicular (-edge.y, edge.x), which points inward for a
 * polygon whose vertices are listed by increasing angle.
 *
 * @return The contact, or std::nullopt if distance >= radius
 */
std::optional<Contact> edgeContact(const Vector &ballCenter,
                                   double radius,
                                   const Vector &a,
                                   const Vector &b);

/**
 * @brief Tests the ball against a single polygon vertex
 *
 * A ball centered exactly on the vertex uses the fallback normal (0, -1).
 *
 * @return The contact, or std::nullopt if distance >= radius
 */
std::optional<Contact> vertexContact(const Vector &ballCenter,
                                     double radius,
                                     const Vector &vertex);

/**
 * @brief Closest overlapping edge or corner over all edges of the polygon
 *
 * A segment contact whose closest point lands on an endpoint is replaced
 * by the vertex contact for that endpoint. On equal distances the earlier
 * edge wins.
 *
 * @return The contact with the smallest distance, or std::nullopt if the
 *         ball touches no edge
 */
std::optional<Contact> nearestContact(const Vector &ballCenter,
                                      double radius,
                                      const std::vector<Vector> &vertices);

/**
 * @brief Applies the relative-velocity reflection and positional correction
 *
 * @param pos Ball position, pushed out along the normal when resolved
 * @param vel Ball velocity, reflected in the wall frame when resolved
 * @param radius Ball radius
 * @param contact Contact found against the ball position the caller sampled
 * @param wallVelocity Velocity of the wall at contact.point
 * @param restitution Coefficient of restitution e
 * @param margin Extra separation added after removing the penetration
 * @return Response::Separating if dot(rel, n) >= 0, otherwise Response::Resolved
 */
Response resolveContact(Components::Position &pos,
                        Components::Velocity &vel,
                        double radius,
                        const Contact &contact,
                        const Vector &wallVelocity,
                        double restitution,
                        double margin);

} // namespace ContainerCollision

namespace Systems {

/**
 * @class ContainerCollisionSystem
 * @brief Keeps every ball inside every rotating container polygon
 */
class ContainerCollisionSystem : public ISystem {
public:
    ContainerCollisionSystem();
    ~ContainerCollisionSystem() override = default;

    void update(entt::registry &registry) override;

private:
    /**
     * @brief Runs the per-edge pass for one ball against one container
     */
    void collideWithContainer(Components::Position &pos,
                              Components::Velocity &vel,
                              double radius,
                              const std::vector<Vector> &vertices,
                              const Components::Position &center,
                              double omega,
                              Components::ContactStats *stats) const;
};

} // namespace Systems

#endif // HEXBALL_CONTAINER_COLLISION_HPP
