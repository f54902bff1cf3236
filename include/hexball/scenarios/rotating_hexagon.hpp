/**
 * @file rotating_hexagon.hpp
 * @brief A ball bouncing inside a spinning regular polygon
 */

#pragma once

#include <entt/entt.hpp>
#include "hexball/components/basic.hpp"
#include "hexball/scenarios/i_scenario.hpp"

/**
 * @struct RotatingHexagonConfig
 * @brief Geometry and initial conditions for the rotating hexagon scenario
 *
 * Units are pixels, seconds and radians in screen space (y down).
 */
struct RotatingHexagonConfig {
    // Container
    Position center{400.0, 300.0};
    double circumradius = 200.0;
    int sides = 6;
    double initialAngle = 0.0;
    double angularSpeed = 0.78539816339744830962;   // pi/4 rad/s

    // Ball
    Position ballPosition{400.0, 200.0};
    Vector ballVelocity{100.0, 0.0};
    double ballRadius = 10.0;

    // Physics
    SystemConfig physics = defaultPhysics();

    Components::Color containerColor{255, 255, 255};
    Components::Color ballColor{255, 0, 0};

    /**
     * @brief Gravity 400, damping 0.1, restitution 0.9, margin 0.1, and the
     *        rotation -> gravity -> movement -> dampening -> collision pipeline
     */
    static SystemConfig defaultPhysics();
};

/**
 * @class RotatingHexagonScenario
 *
 * One container entity and one ball entity, both built from a
 * RotatingHexagonConfig supplied at construction.
 */
class RotatingHexagonScenario : public IScenario {
public:
    RotatingHexagonScenario() = default;
    explicit RotatingHexagonScenario(RotatingHexagonConfig config);
    ~RotatingHexagonScenario() override = default;

    SystemConfig getConfig() const override;
    void createEntities(entt::registry &registry) const override;
    std::string getName() const override { return "ROTATING_HEXAGON"; }

private:
    RotatingHexagonConfig scenarioConfig;
};
