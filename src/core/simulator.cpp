/**
 * @fileoverview simulator.cpp
 * @brief Implementation of Simulator.
 */

#include "hexball/core/simulator.hpp"

#include <iostream>
#include <memory>

#include "hexball/components/basic.hpp"
#include "hexball/components/sim.hpp"
#include "hexball/core/debug.hpp"
#include "hexball/core/profile.hpp"
#include "hexball/math/polygon.hpp"
#include "hexball/systems/container_collision.hpp"
#include "hexball/systems/dampening.hpp"
#include "hexball/systems/gravity.hpp"
#include "hexball/systems/movement.hpp"
#include "hexball/systems/rotation.hpp"

namespace {

/**
 * @brief Reports configuration outside the supported range on stderr
 *
 * Nothing is rejected: out-of-contract values only produce meaningless
 * (possibly NaN) numbers, never a crash.
 */
void warnOnSuspectConfig(entt::registry& registry, const SystemConfig& cfg) {
  auto warn = [](const char* what) {
    std::cerr << "[Simulator] Warning: " << what << std::endl;
  };

  if (cfg.Restitution < 0.0 || cfg.Restitution > 1.0) {
    warn("restitution outside [0,1]");
  }
  if (cfg.Gravity < 0.0) {
    warn("negative gravity");
  }
  if (cfg.Damping < 0.0) {
    warn("negative damping");
  }
  if (cfg.ContactMargin < 0.0) {
    warn("negative contact margin");
  }

  auto containers = registry.view<Components::Container, Components::RegularPolygon>();
  for (auto entity : containers) {
    const auto& shape = registry.get<Components::RegularPolygon>(entity);
    if (shape.sides < 3) {
      warn("container needs at least 3 sides");
    }
    if (shape.circumradius <= 0.0) {
      warn("container circumradius must be positive");
    }
  }

  auto balls = registry.view<Components::Ball, Components::Radius>();
  for (auto entity : balls) {
    if (registry.get<Components::Radius>(entity).value <= 0.0) {
      warn("ball radius must be positive");
    }
  }
}

std::unique_ptr<Systems::ISystem> makeSystem(Systems::SystemType type) {
  switch (type) {
    case Systems::SystemType::ROTATION:
      return std::make_unique<Systems::RotationSystem>();
    case Systems::SystemType::GRAVITY:
      return std::make_unique<Systems::GravitySystem>();
    case Systems::SystemType::MOVEMENT:
      return std::make_unique<Systems::MovementSystem>();
    case Systems::SystemType::DAMPENING:
      return std::make_unique<Systems::DampeningSystem>();
    case Systems::SystemType::CONTAINER_COLLISION:
      return std::make_unique<Systems::ContainerCollisionSystem>();
  }
  return nullptr;
}

}  // namespace

Simulator::Simulator() = default;

Simulator::~Simulator() = default;

void Simulator::loadScenario(std::unique_ptr<IScenario> scenario) {
  scenarioPtr = std::move(scenario);
  if (!scenarioPtr) {
    std::cerr << "[Simulator] Warning: loadScenario called with no scenario" << std::endl;
    registry.clear();
    systems.clear();
    return;
  }
  currentConfig = scenarioPtr->getConfig();
  std::cout << "Simulator: loading scenario " << scenarioPtr->getName() << std::endl;
  reset();
  warnOnSuspectConfig(registry, currentConfig);
}

void Simulator::reset() {
  Components::SimulatorState savedState;

  auto stateView = registry.view<Components::SimulatorState>();
  if (!stateView.empty()) {
    savedState.timeScale = registry.get<Components::SimulatorState>(stateView.front()).timeScale;
  }

  registry.clear();

  auto stateEntity = registry.create();
  registry.emplace<Components::SimulatorState>(stateEntity, savedState);
  registry.emplace<Components::ContactStats>(stateEntity);

  if (scenarioPtr) {
    scenarioPtr->createEntities(registry);
  }

  warnedUnstableDamping = false;
  createSystems();
}

void Simulator::createSystems() {
  systems.clear();

  for (auto type : currentConfig.activeSystems) {
    if (auto system = makeSystem(type)) {
      system->setSystemConfig(currentConfig);
      systems.push_back(std::move(system));
    }
  }
}

void Simulator::step(double dt) {
  PROFILE_SCOPE("Simulator::step");

  if (!scenarioPtr) {
    return;
  }

  auto stateView = registry.view<Components::SimulatorState>();
  auto stateEntity = stateView.front();
  auto& state = registry.get<Components::SimulatorState>(stateEntity);
  state.dt = dt;

  if (!warnedUnstableDamping && !currentConfig.ClampDampingFactor &&
      currentConfig.Damping * dt >= 1.0) {
    std::cerr << "[Simulator] Warning: damping * dt = " << currentConfig.Damping * dt
              << " >= 1, velocity damping will overshoot" << std::endl;
    warnedUnstableDamping = true;
  }

  registry.get<Components::ContactStats>(stateEntity).reset();

  for (auto& system : systems) {
    system->update(registry);
  }

  // Systems may touch the registry; look the state up again.
  auto& after = registry.get<Components::SimulatorState>(stateEntity);
  after.elapsed += dt;
  after.stepCount++;

  DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[Simulator] step " << after.stepCount
            << " t=" << after.elapsed << "\n");
}

RenderState Simulator::getRenderState() const {
  RenderState out;

  auto containers = registry.view<const Components::Container,
                                  const Components::Position,
                                  const Components::RegularPolygon,
                                  const Components::AngularPosition>();
  for (auto entity : containers) {
    const auto& center = registry.get<Components::Position>(entity);
    const auto& shape = registry.get<Components::RegularPolygon>(entity);
    const auto& angPos = registry.get<Components::AngularPosition>(entity);
    out.polygonVertices =
        regularPolygonVertices(center, shape.circumradius, shape.sides, angPos.angle);
    if (const auto* color = registry.try_get<Components::Color>(entity)) {
      out.containerColor = *color;
    }
    break;
  }

  auto balls = registry.view<const Components::Ball,
                             const Components::Position,
                             const Components::Radius>();
  for (auto entity : balls) {
    out.ballPosition = registry.get<Components::Position>(entity);
    out.ballRadius = registry.get<Components::Radius>(entity).value;
    if (const auto* color = registry.try_get<Components::Color>(entity)) {
      out.ballColor = *color;
    }
    break;
  }

  return out;
}

void Simulator::setTimeScale(double timeScale) {
  auto view = registry.view<Components::SimulatorState>();
  if (!view.empty()) {
    registry.get<Components::SimulatorState>(view.front()).timeScale = timeScale;
  }
}

double Simulator::getTimeScale() const {
  auto view = registry.view<const Components::SimulatorState>();
  if (view.empty()) {
    return 1.0;
  }
  return registry.get<Components::SimulatorState>(view.front()).timeScale;
}
