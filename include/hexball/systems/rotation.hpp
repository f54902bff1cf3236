/**
 * @file rotation.hpp
 * @brief System for advancing rotations at constant angular velocity
 *
 * Required components:
 * - AngularPosition (to modify)
 * - AngularVelocity (to read)
 */

#pragma once

#include <entt/entt.hpp>
#include "hexball/systems/i_system.hpp"

namespace Systems {

/**
 * @class RotationSystem
 * @brief Integrates angle += omega * dt
 *
 * The angle is left unbounded; the trigonometry that consumes it wraps
 * implicitly. Angular velocity is never modified.
 */
class RotationSystem : public ISystem {
public:
    RotationSystem();
    ~RotationSystem() override = default;

    void update(entt::registry &registry) override;
};

} // namespace Systems
