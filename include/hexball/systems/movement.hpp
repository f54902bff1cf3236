/**
 * @file movement.hpp
 * @brief System for updating positions based on velocity
 *
 * Required components:
 * - Ball (tag)
 * - Position (to modify)
 * - Velocity (to read)
 */

#ifndef HEXBALL_MOVEMENT_SYSTEM_HPP
#define HEXBALL_MOVEMENT_SYSTEM_HPP

#include <entt/entt.hpp>
#include "hexball/systems/i_system.hpp"

namespace Systems {

/**
 * @brief Updates ball positions according to their velocity
 *
 * The container entity also carries a Position (its center) but no
 * Velocity, so it is never moved.
 */
class MovementSystem : public ISystem {
public:
    MovementSystem();
    ~MovementSystem() override = default;

    void update(entt::registry &registry) override;
};

} // namespace Systems

#endif // HEXBALL_MOVEMENT_SYSTEM_HPP
