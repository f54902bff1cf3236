/**
 * @file dampening.cpp
 * @brief Implementation of velocity dampening system
 */

#include "hexball/systems/dampening.hpp"
#include "hexball/components/basic.hpp"
#include "hexball/core/profile.hpp"

#include <algorithm>

namespace Systems {

DampeningSystem::DampeningSystem() = default;

double DampeningSystem::dampingFactor(double damping, double dt, bool clamp) {
    double const factor = 1.0 - damping * dt;
    if (clamp) {
        return std::max(0.0, std::min(1.0, factor));
    }
    return factor;
}

void DampeningSystem::update(entt::registry &registry) {
    PROFILE_SCOPE("DampeningSystem");

    double const dt = currentStepSeconds(registry);
    double const factor = dampingFactor(sysConfig.Damping, dt, sysConfig.ClampDampingFactor);

    auto view = registry.view<Components::Ball, Components::Velocity>();
    for (auto [entity, vel] : view.each()) {
        vel.x *= factor;
        vel.y *= factor;
    }
}

} // namespace Systems
