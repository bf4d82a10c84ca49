#include "Integrator.hpp"

void updatePosition(Particle& particle, const SimulationConfig& cfg)
{
    const double dt = cfg.dt;
    particle.position += particle.velocity * dt + particle.force * (0.5 * dt * dt / cfg.mass);
}

void updateVelocity(Particle& particle, const Vec3& newForce, const SimulationConfig& cfg)
{
    particle.velocity += (particle.force + newForce) * (0.5 * cfg.dt / cfg.mass);
    particle.force = newForce;
}
