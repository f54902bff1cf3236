#ifndef HEXBALL_I_SCENARIO_HPP
#define HEXBALL_I_SCENARIO_HPP

#include <string>
#include <entt/entt.hpp>
#include "hexball/core/system_config.hpp"

/**
 * @brief Abstract base class for any simulation scenario
 *
 * Each scenario must provide:
 *  - getConfig() returning the physics SystemConfig
 *  - createEntities() that spawns the ball and its container
 */
class IScenario {
public:
    virtual ~IScenario() = default;

    /**
     * @brief Returns the physics constants and the ordered system list
     */
    virtual SystemConfig getConfig() const = 0;

    /**
     * @brief Creates scenario-specific entities in the registry
     */
    virtual void createEntities(entt::registry &registry) const = 0;

    virtual std::string getName() const = 0;
};

#endif // HEXBALL_I_SCENARIO_HPP
