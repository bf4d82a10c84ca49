#pragma once
#include "Particles.hpp"
#include "SimulationConfig.hpp"

// Velocity-Verlet split into its two halves. The driver must call them in the
// order: updatePosition -> enforceBoundaries -> computeForces -> updateVelocity.

// p <- p + v*dt + 0.5*f*dt^2/m, using the force stored from the previous step
void updatePosition(Particle& particle, const SimulationConfig& cfg);

// v <- v + 0.5*(f_old + f_new)*dt/m, then f_new becomes the stored force
void updateVelocity(Particle& particle, const Vec3& newForce, const SimulationConfig& cfg);
