#include <gtest/gtest.h>
#include "Integrator.hpp"

namespace {
    SimulationConfig integratorConfig() {
        SimulationConfig cfg;
        cfg.dt = 0.1;
        cfg.mass = 2.0;
        return cfg;
    }
}

TEST(Integrator, PositionUsesVelocityAndStoredForce) {
    SimulationConfig cfg = integratorConfig();
    Particle particle(Vec3(1.0, 2.0, 3.0), Vec3(1.0, -1.0, 0.0));
    particle.force = Vec3(2.0, 0.0, -4.0);

    updatePosition(particle, cfg);

    EXPECT_DOUBLE_EQ(particle.position.x, 1.0 + 0.1 + 0.5 * 2.0 * 0.01 / 2.0);
    EXPECT_DOUBLE_EQ(particle.position.y, 2.0 - 0.1);
    EXPECT_DOUBLE_EQ(particle.position.z, 3.0 - 0.5 * 4.0 * 0.01 / 2.0);
    EXPECT_EQ(particle.velocity, Vec3(1.0, -1.0, 0.0));
}

TEST(Integrator, VelocityAveragesOldAndNewForce) {
    SimulationConfig cfg = integratorConfig();
    Particle particle(Vec3(), Vec3(1.0, 0.0, 0.0));
    particle.force = Vec3(2.0, 0.0, 0.0);

    updateVelocity(particle, Vec3(4.0, 1.0, 0.0), cfg);

    EXPECT_DOUBLE_EQ(particle.velocity.x, 1.0 + (2.0 + 4.0) * 0.5 * 0.1 / 2.0);
    EXPECT_DOUBLE_EQ(particle.velocity.y, 1.0 * 0.5 * 0.1 / 2.0);
    EXPECT_EQ(particle.force, Vec3(4.0, 1.0, 0.0));
}

TEST(Integrator, FreeParticleMovesInStraightLine) {
    SimulationConfig cfg = integratorConfig();
    Particle particle(Vec3(0.0, 0.0, 0.0), Vec3(1.0, 2.0, 3.0));

    for (int step = 0; step < 10; ++step) {
        updatePosition(particle, cfg);
        updateVelocity(particle, Vec3(), cfg);
    }

    EXPECT_NEAR(particle.position.x, 1.0, 1e-12);
    EXPECT_NEAR(particle.position.y, 2.0, 1e-12);
    EXPECT_NEAR(particle.position.z, 3.0, 1e-12);
    EXPECT_EQ(particle.velocity, Vec3(1.0, 2.0, 3.0));
}
