/**
 * @file rotating_hexagon.cpp
 * @brief Implementation of the rotating hexagon scenario.
 *
 * The container is a static-centered regular polygon that only rotates; the
 * ball is the single dynamic body. Defaults reproduce an 800x600 window with
 * a radius-200 hexagon turning at 45 degrees per second.
 */

#include <utility>

#include "hexball/components/basic.hpp"
#include "hexball/scenarios/rotating_hexagon.hpp"

SystemConfig RotatingHexagonConfig::defaultPhysics() {
  SystemConfig cfg;
  cfg.Gravity = 400.0;
  cfg.Damping = 0.1;
  cfg.Restitution = 0.9;
  cfg.ContactMargin = 0.1;
  cfg.ClampDampingFactor = false;
  cfg.Contacts = ContactMode::EdgeAndEndpoints;

  // Order matters: rotate the walls, integrate the ball (velocity before
  // position), then resolve against the walls at their new angle.
  cfg.activeSystems = {
      Systems::SystemType::ROTATION,
      Systems::SystemType::GRAVITY,
      Systems::SystemType::MOVEMENT,
      Systems::SystemType::DAMPENING,
      Systems::SystemType::CONTAINER_COLLISION,
  };
  return cfg;
}

RotatingHexagonScenario::RotatingHexagonScenario(RotatingHexagonConfig config)
    : scenarioConfig(std::move(config)) {}

SystemConfig RotatingHexagonScenario::getConfig() const {
  return scenarioConfig.physics;
}

void RotatingHexagonScenario::createEntities(entt::registry& registry) const {
  const auto& cfg = scenarioConfig;

  auto container = registry.create();
  registry.emplace<Components::Container>(container);
  registry.emplace<Components::Position>(container, cfg.center);
  registry.emplace<Components::RegularPolygon>(container, cfg.circumradius, cfg.sides);
  registry.emplace<Components::AngularPosition>(container, cfg.initialAngle);
  registry.emplace<Components::AngularVelocity>(container, cfg.angularSpeed);
  registry.emplace<Components::Color>(container, cfg.containerColor);

  auto ball = registry.create();
  registry.emplace<Components::Ball>(ball);
  registry.emplace<Components::Position>(ball, cfg.ballPosition);
  registry.emplace<Components::Velocity>(ball, cfg.ballVelocity);
  registry.emplace<Components::Radius>(ball, cfg.ballRadius);
  registry.emplace<Components::Color>(ball, cfg.ballColor);
}
