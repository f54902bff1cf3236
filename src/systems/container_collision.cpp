/**
 * @file container_collision.cpp
 * @brief Ball vs. rotating polygon contacts with moving-wall reflection
 */

#include "hexball/systems/container_collision.hpp"

#include "hexball/core/debug.hpp"
#include "hexball/core/profile.hpp"
#include "hexball/math/polygon.hpp"

namespace ContainerCollision {

std::optional<Contact> edgeContact(const Vector &ballCenter,
                                   double radius,
                                   const Vector &a,
                                   const Vector &b)
{
    Vector const closest = closestPointOnSegment(a, b, ballCenter);
    Vector const diff = ballCenter - closest;
    double const dist = diff.length();
    if (dist >= radius) {
        return std::nullopt;
    }

    Vector normal;
    if (dist == 0.0) {
        // Center on the wall line: no direction from diff, use the inward
        // perpendicular of the edge.
        normal = (b - a).perp().normalized();
    } else {
        normal = diff.normalized();
    }
    return Contact{closest, normal, dist};
}

std::optional<Contact> vertexContact(const Vector &ballCenter,
                                     double radius,
                                     const Vector &vertex)
{
    Vector const diff = ballCenter - vertex;
    double const dist = diff.length();
    if (dist >= radius) {
        return std::nullopt;
    }

    Vector const normal = (dist == 0.0) ? Vector(0.0, -1.0) : diff.normalized();
    return Contact{vertex, normal, dist, true};
}

std::optional<Contact> nearestContact(const Vector &ballCenter,
                                      double radius,
                                      const std::vector<Vector> &vertices)
{
    std::optional<Contact> best;

    for (std::size_t i = 0; i < vertices.size(); ++i) {
        auto const [a, b] = polygonEdge(vertices, i);

        auto c = edgeContact(ballCenter, radius, a, b);
        if (!c) {
            continue;
        }

        for (const Vector &endpoint : {a, b}) {
            if ((c->point - endpoint).lengthSquared() <= EPSILON * EPSILON) {
                if (auto v = vertexContact(ballCenter, radius, endpoint)) {
                    c = v;
                }
                break;
            }
        }

        if (!best || c->distance < best->distance) {
            best = c;
        }
    }
    return best;
}

Response resolveContact(Components::Position &pos,
                        Components::Velocity &vel,
                        double radius,
                        const Contact &contact,
                        const Vector &wallVelocity,
                        double restitution,
                        double margin)
{
    Vector const relativeVel = vel - wallVelocity;
    double const closing = relativeVel.dotProduct(contact.normal);
    if (closing >= 0.0) {
        return Response::Separating;
    }

    Vector const reflected = relativeVel - contact.normal * ((1.0 + restitution) * closing);
    vel = reflected + wallVelocity;

    double const penetration = radius - contact.distance;
    pos += contact.normal * (penetration + margin);
    return Response::Resolved;
}

} // namespace ContainerCollision

namespace Systems {

ContainerCollisionSystem::ContainerCollisionSystem() = default;

void ContainerCollisionSystem::collideWithContainer(Components::Position &pos,
                                                    Components::Velocity &vel,
                                                    double radius,
                                                    const std::vector<Vector> &vertices,
                                                    const Components::Position &center,
                                                    double omega,
                                                    Components::ContactStats *stats) const
{
    using namespace ContainerCollision;

    double const e = sysConfig.Restitution;
    double const margin = sysConfig.ContactMargin;

    auto record = [stats](Response r, bool vertex) {
        if (!stats) {
            return;
        }
        if (r == Response::Separating) {
            stats->separatingContacts++;
        } else if (vertex) {
            stats->vertexContacts++;
        } else {
            stats->edgeContacts++;
        }
    };

    if (sysConfig.Contacts == ContactMode::NearestFeature) {
        if (auto c = nearestContact(pos, radius, vertices)) {
            Vector const wallVel = pointVelocityOnRotatingBody(c->point, center, omega);
            record(resolveContact(pos, vel, radius, *c, wallVel, e, margin), c->vertex);
        }
        return;
    }

    for (std::size_t i = 0; i < vertices.size(); ++i) {
        auto const [a, b] = polygonEdge(vertices, i);

        // Sampled once per edge: the endpoint tests below see the ball
        // where it was before this edge's correction, but with the
        // velocity that correction produced.
        Vector const ballCenter = pos;

        if (auto c = edgeContact(ballCenter, radius, a, b)) {
            Vector const wallVel = pointVelocityOnRotatingBody(c->point, center, omega);
            record(resolveContact(pos, vel, radius, *c, wallVel, e, margin), false);
        }

        for (const Vector &endpoint : {a, b}) {
            if (auto c = vertexContact(ballCenter, radius, endpoint)) {
                Vector const wallVel = pointVelocityOnRotatingBody(endpoint, center, omega);
                record(resolveContact(pos, vel, radius, *c, wallVel, e, margin), true);
            }
        }
    }
}

void ContainerCollisionSystem::update(entt::registry &registry) {
    PROFILE_SCOPE("ContainerCollisionSystem");

    Components::ContactStats *stats = nullptr;
    auto statsView = registry.view<Components::ContactStats>();
    if (!statsView.empty()) {
        stats = &registry.get<Components::ContactStats>(statsView.front());
    }

    auto containers = registry.view<Components::Container,
                                    Components::Position,
                                    Components::RegularPolygon,
                                    Components::AngularPosition,
                                    Components::AngularVelocity>();
    auto balls = registry.view<Components::Ball,
                               Components::Position,
                               Components::Velocity,
                               Components::Radius>();

    for (auto [container, center, shape, angPos, angVel] : containers.each()) {
        std::vector<Vector> const vertices =
            regularPolygonVertices(center, shape.circumradius, shape.sides, angPos.angle);

        for (auto [ball, pos, vel, radius] : balls.each()) {
            collideWithContainer(pos, vel, radius.value, vertices, center, angVel.omega, stats);
        }
    }

    if (stats && stats->resolved() > 0) {
        DEBUG_MSG(DEBUG_LEVEL_VERBOSE,
            "[ContainerCollision] edge=" << stats->edgeContacts
            << " vertex=" << stats->vertexContacts
            << " separating=" << stats->separatingContacts << "\n");
    }
}

} // namespace Systems
