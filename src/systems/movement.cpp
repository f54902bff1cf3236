#include "hexball/systems/movement.hpp"
#include "hexball/components/basic.hpp"
#include "hexball/core/profile.hpp"

namespace Systems {

MovementSystem::MovementSystem() = default;

void MovementSystem::update(entt::registry &registry) {
    PROFILE_SCOPE("MovementSystem");

    double const dt = currentStepSeconds(registry);

    auto view = registry.view<Components::Ball, Components::Position, Components::Velocity>();
    for (auto [entity, pos, vel] : view.each()) {
        pos.x += vel.x * dt;
        pos.y += vel.y * dt;
    }
}

} // namespace Systems
