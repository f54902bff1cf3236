/**
 * @file gravity.cpp
 * @brief Implementation of the uniform gravity system
 */

#include "hexball/systems/gravity.hpp"
#include "hexball/components/basic.hpp"
#include "hexball/core/profile.hpp"

namespace Systems {

GravitySystem::GravitySystem() = default;

void GravitySystem::update(entt::registry& registry) {
    PROFILE_SCOPE("GravitySystem");

    double const dt = currentStepSeconds(registry);
    double const gravity = sysConfig.Gravity;

    auto view = registry.view<Components::Ball, Components::Velocity>();
    for (auto [entity, vel] : view.each()) {
        vel.y += gravity * dt;
    }
}

} // namespace Systems
