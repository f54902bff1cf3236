#include <gtest/gtest.h>

#include "hexball/components/basic.hpp"
#include "hexball/components/sim.hpp"
#include "hexball/systems/dampening.hpp"
#include "hexball/systems/gravity.hpp"
#include "hexball/systems/movement.hpp"
#include "hexball/systems/rotation.hpp"

using namespace Systems;

class IntegratorTest : public ::testing::Test {
protected:
    entt::registry registry;
    SystemConfig config;

    entt::entity createBall(double x, double y, double vx, double vy) {
        auto entity = registry.create();
        registry.emplace<Components::Ball>(entity);
        registry.emplace<Components::Position>(entity, x, y);
        registry.emplace<Components::Velocity>(entity, vx, vy);
        registry.emplace<Components::Radius>(entity, 10.0);
        return entity;
    }

    void setStep(double dt) {
        auto view = registry.view<Components::SimulatorState>();
        registry.get<Components::SimulatorState>(view.front()).dt = dt;
    }

    void SetUp() override {
        auto state = registry.create();
        registry.emplace<Components::SimulatorState>(state);
        config.Gravity = 400.0;
        config.Damping = 0.1;
    }
};

TEST_F(IntegratorTest, GravityAddsToVerticalVelocityOnly) {
    auto ball = createBall(0.0, 0.0, 100.0, -5.0);
    setStep(0.5);

    GravitySystem gravity;
    gravity.setSystemConfig(config);
    gravity.update(registry);

    const auto& vel = registry.get<Components::Velocity>(ball);
    EXPECT_DOUBLE_EQ(vel.x, 100.0);
    EXPECT_DOUBLE_EQ(vel.y, -5.0 + 400.0 * 0.5);
}

TEST_F(IntegratorTest, GravityIgnoresEntitiesWithoutBallTag) {
    auto other = registry.create();
    registry.emplace<Components::Velocity>(other, 1.0, 2.0);
    setStep(1.0);

    GravitySystem gravity;
    gravity.setSystemConfig(config);
    gravity.update(registry);

    const auto& vel = registry.get<Components::Velocity>(other);
    EXPECT_DOUBLE_EQ(vel.y, 2.0);
}

TEST_F(IntegratorTest, MovementAdvancesPositionByVelocity) {
    auto ball = createBall(10.0, 20.0, 3.0, -4.0);
    setStep(0.25);

    MovementSystem movement;
    movement.update(registry);

    const auto& pos = registry.get<Components::Position>(ball);
    EXPECT_DOUBLE_EQ(pos.x, 10.0 + 3.0 * 0.25);
    EXPECT_DOUBLE_EQ(pos.y, 20.0 - 4.0 * 0.25);
}

TEST_F(IntegratorTest, DampeningScalesVelocityLinearly) {
    auto ball = createBall(0.0, 0.0, 100.0, 50.0);
    setStep(0.1);

    DampeningSystem dampening;
    dampening.setSystemConfig(config);
    dampening.update(registry);

    double const factor = 1.0 - 0.1 * 0.1;
    const auto& vel = registry.get<Components::Velocity>(ball);
    EXPECT_DOUBLE_EQ(vel.x, 100.0 * factor);
    EXPECT_DOUBLE_EQ(vel.y, 50.0 * factor);
}

TEST_F(IntegratorTest, DampingFactorInvertsWithoutClamp) {
    // d * dt = 2 flips the sign of the velocity
    EXPECT_DOUBLE_EQ(DampeningSystem::dampingFactor(4.0, 0.5, false), -1.0);
    EXPECT_DOUBLE_EQ(DampeningSystem::dampingFactor(4.0, 0.5, true), 0.0);
    EXPECT_DOUBLE_EQ(DampeningSystem::dampingFactor(0.1, 0.5, true), 0.95);
    // Negative damping would amplify; the clamp caps the factor at 1
    EXPECT_DOUBLE_EQ(DampeningSystem::dampingFactor(-1.0, 0.5, true), 1.0);
}

TEST_F(IntegratorTest, ClampedDampingStopsBallInsteadOfReversing) {
    auto ball = createBall(0.0, 0.0, 100.0, 50.0);
    setStep(1.0);
    config.Damping = 3.0;
    config.ClampDampingFactor = true;

    DampeningSystem dampening;
    dampening.setSystemConfig(config);
    dampening.update(registry);

    const auto& vel = registry.get<Components::Velocity>(ball);
    EXPECT_DOUBLE_EQ(vel.x, 0.0);
    EXPECT_DOUBLE_EQ(vel.y, 0.0);
}

TEST_F(IntegratorTest, SemiImplicitEulerUsesUpdatedVelocity) {
    auto ball = createBall(0.0, 0.0, 0.0, 0.0);
    double const dt = 0.1;
    setStep(dt);

    GravitySystem gravity;
    gravity.setSystemConfig(config);
    MovementSystem movement;
    DampeningSystem dampening;
    dampening.setSystemConfig(config);

    gravity.update(registry);
    movement.update(registry);
    dampening.update(registry);

    // Position uses the velocity after gravity but before damping
    const auto& pos = registry.get<Components::Position>(ball);
    const auto& vel = registry.get<Components::Velocity>(ball);
    EXPECT_DOUBLE_EQ(pos.y, 400.0 * dt * dt);
    EXPECT_DOUBLE_EQ(vel.y, 400.0 * dt * (1.0 - 0.1 * dt));
}

TEST_F(IntegratorTest, RotationAdvancesAngleAndKeepsOmega) {
    auto container = registry.create();
    registry.emplace<Components::AngularPosition>(container, 1.0);
    registry.emplace<Components::AngularVelocity>(container, 0.5);
    setStep(2.0);

    RotationSystem rotation;
    for (int i = 0; i < 10; ++i) {
        rotation.update(registry);
    }

    // The angle is never wrapped
    EXPECT_DOUBLE_EQ(registry.get<Components::AngularPosition>(container).angle, 11.0);
    EXPECT_DOUBLE_EQ(registry.get<Components::AngularVelocity>(container).omega, 0.5);
}
