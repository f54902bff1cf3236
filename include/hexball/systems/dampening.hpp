/**
 * @file dampening.hpp
 * @brief System for applying continuous linear velocity damping
 *
 * Each step scales the ball velocity by (1 - d * dt), a first-order
 * approximation of exp(-d * dt). The factor goes negative once
 * d * dt > 1; SystemConfig::ClampDampingFactor clamps it to [0,1].
 *
 * Required components:
 * - Ball (tag)
 * - Velocity (to modify)
 */

#ifndef HEXBALL_DAMPENING_SYSTEM_HPP
#define HEXBALL_DAMPENING_SYSTEM_HPP

#include <entt/entt.hpp>
#include "hexball/systems/i_system.hpp"

namespace Systems {

/**
 * @class DampeningSystem
 * @brief Dampens the linear velocity of every ball
 */
class DampeningSystem : public ISystem {
public:
    DampeningSystem();
    ~DampeningSystem() override = default;

    /**
     * @brief Applies velocity damping
     * @param registry EnTT registry containing entities and components
     */
    void update(entt::registry &registry) override;

    /**
     * @brief Per-step velocity multiplier for the given step length
     */
    static double dampingFactor(double damping, double dt, bool clamp);
};

} // namespace Systems

#endif // HEXBALL_DAMPENING_SYSTEM_HPP
