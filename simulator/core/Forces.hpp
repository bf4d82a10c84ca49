#pragma once
#include "Particles.hpp"
#include "SimulationConfig.hpp"
#include <vector>

// One force accumulator per particle, indexed like the ensemble
using ForceField = std::vector<Vec3>;

// Lennard-Jones force for the displacement r = p_j - p_i.
// Magnitude 24*eps*(2*sigma^12/|r|^13 - sigma^6/|r|^7) along r/|r|; zero for
// coincident particles and for |r| > cutoff.
Vec3 lennardJonesForce(const Vec3& r, const SimulationConfig& cfg);

// Pair potential 4*eps*((sigma/r)^12 - (sigma/r)^6), zero outside (0, cutoff]
double lennardJonesPotential(double r, const SimulationConfig& cfg);

// Resets every accumulator in 'forces' (resized to p.n) and sums all pair
// contributions, each unordered pair i < j evaluated once: added to i,
// subtracted from j.
void computeForces(const Particles& p, const SimulationConfig& cfg, ForceField& forces);

ForceField computeForces(const Particles& p, const SimulationConfig& cfg);

// Total truncated pair potential energy of the ensemble
double computePotentialEnergy(const Particles& p, const SimulationConfig& cfg);

// Total kinetic energy sum(0.5 * m * |v|^2)
double computeKineticEnergy(const Particles& p, const SimulationConfig& cfg);
