#pragma once

/**
 * @brief Defines available ECS systems for the simulation.
 */
namespace Systems {

/**
 * @enum SystemType
 * @brief The ECS systems a scenario can activate, run in list order.
 */
enum class SystemType {
    ROTATION,
    GRAVITY,
    MOVEMENT,
    DAMPENING,
    CONTAINER_COLLISION,
};

} // namespace Systems
