/**
 * @file i_system.hpp
 * @brief Interface for all ECS systems in the simulation
 */

#pragma once

#include <entt/entt.hpp>
#include "hexball/components/sim.hpp"
#include "hexball/core/system_config.hpp"

namespace Systems {

/**
 * @class ISystem
 * @brief Base interface for all ECS systems
 *
 * Every system is updated once per tick, in the order the scenario lists
 * them, and receives the shared SystemConfig when the scenario is loaded.
 */
class ISystem {
protected:
    SystemConfig sysConfig;  // Common configuration all systems have

public:
    virtual ~ISystem() = default;

    /**
     * @brief Updates the system for one simulation step
     *
     * @param registry EnTT registry containing all entities and components
     */
    virtual void update(entt::registry& registry) = 0;

    /**
     * @brief Sets the system configuration
     *
     * @param config System configuration parameters
     */
    virtual void setSystemConfig(const SystemConfig& config) {
        sysConfig = config;
    }
};

/**
 * @brief Reads the step duration from the SimulatorState singleton
 *
 * @return dt of the step in progress, or 0 if no state entity exists
 */
inline double currentStepSeconds(entt::registry& registry) {
    auto view = registry.view<Components::SimulatorState>();
    if (view.empty()) {
        return 0.0;
    }
    return registry.get<Components::SimulatorState>(view.front()).dt;
}

} // namespace Systems
