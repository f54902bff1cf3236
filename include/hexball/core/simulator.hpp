/**
 * @file simulator.hpp
 * @brief Owns one simulation: an ECS registry, its systems and its scenario.
 */

#pragma once

#include <memory>
#include <vector>
#include <entt/entt.hpp>

#include "hexball/components/basic.hpp"
#include "hexball/core/system_config.hpp"
#include "hexball/math/vector_math.hpp"
#include "hexball/scenarios/i_scenario.hpp"
#include "hexball/systems/i_system.hpp"

/**
 * @brief Read-only snapshot of what the shell needs to draw one frame
 */
struct RenderState {
    std::vector<Vector> polygonVertices;  ///< Container outline, by increasing angle
    Position ballPosition;
    double ballRadius = 0.0;
    Components::Color containerColor;
    Components::Color ballColor;
};

/**
 * @class Simulator
 * @brief Steps one ball inside one rotating container.
 *
 * All state lives in the registry owned by this object, so several
 * simulators can run side by side. The simulator never reads a clock;
 * the caller supplies dt.
 */
class Simulator {
private:
    entt::registry registry;
    std::unique_ptr<IScenario> scenarioPtr;
    std::vector<std::unique_ptr<Systems::ISystem>> systems;
    SystemConfig currentConfig;
    bool warnedUnstableDamping = false;

    void createSystems();

public:
    Simulator();
    ~Simulator();

    Simulator(const Simulator&) = delete;
    Simulator& operator=(const Simulator&) = delete;

    /**
     * @brief Takes ownership of a scenario and builds its entities
     *
     * Configuration outside the supported range is reported on stderr but
     * still loaded. A null scenario unloads the current one.
     */
    void loadScenario(std::unique_ptr<IScenario> scenario);

    /**
     * @brief Rebuilds the registry from the current scenario
     *
     * The time scale survives a reset; elapsed time and step count do not.
     */
    void reset();

    /**
     * @brief Advances the simulation by dt seconds
     *
     * Runs the active systems in scenario order. Does nothing if no
     * scenario is loaded. dt is not validated.
     */
    void step(double dt);

    /**
     * @brief Snapshot of the container outline and the ball
     *
     * Empty if no scenario is loaded.
     */
    RenderState getRenderState() const;

    /**
     * @brief Sets the multiplier the shell applies to wall-clock frame time
     */
    void setTimeScale(double timeScale);
    double getTimeScale() const;

    const SystemConfig& getConfig() const { return currentConfig; }
    bool hasScenario() const { return scenarioPtr != nullptr; }

    entt::registry& getRegistry() { return registry; }
    const entt::registry& getRegistry() const { return registry; }
};
