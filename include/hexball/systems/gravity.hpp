/**
 * @file gravity.hpp
 * @brief Uniform gravitational field acting on the ball
 *
 * Applies a constant acceleration along +y (screen down) to every Ball
 * entity. First stage of the integrator: velocity is updated before the
 * movement system uses it, which gives semi-implicit Euler.
 *
 * Required components:
 * - Ball (tag)
 * - Velocity (to modify)
 */

#ifndef HEXBALL_GRAVITY_SYSTEM_H
#define HEXBALL_GRAVITY_SYSTEM_H

#include <entt/entt.hpp>
#include "hexball/systems/i_system.hpp"

namespace Systems {

/**
 * @class GravitySystem
 * @brief vy += g * dt, with g taken from SystemConfig::Gravity
 */
class GravitySystem : public ISystem {
public:
    GravitySystem();
    ~GravitySystem() override = default;

    /**
     * @brief Updates velocities of all entities affected by gravity
     * @param registry EnTT registry containing entities and components
     */
    void update(entt::registry& registry) override;
};

} // namespace Systems

#endif // HEXBALL_GRAVITY_SYSTEM_H
