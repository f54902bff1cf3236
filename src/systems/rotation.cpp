/**
 * @file rotation.cpp
 * @brief Implementation of the rotation system
 */

#include "hexball/systems/rotation.hpp"
#include "hexball/components/basic.hpp"
#include "hexball/core/profile.hpp"

namespace Systems {

RotationSystem::RotationSystem() = default;

void RotationSystem::update(entt::registry &registry) {
    PROFILE_SCOPE("RotationSystem");

    double const dt = currentStepSeconds(registry);

    auto view = registry.view<Components::AngularPosition, Components::AngularVelocity>();
    for (auto [entity, angPos, angVel] : view.each()) {
        angPos.angle += angVel.omega * dt;
    }
}

} // namespace Systems
