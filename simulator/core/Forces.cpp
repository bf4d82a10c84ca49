#include "Forces.hpp"
#include <cmath>

Vec3 lennardJonesForce(const Vec3& r, const SimulationConfig& cfg)
{
    const double rMag = r.length();
    if (rMag == 0.0 || rMag > cfg.cutoffRadius) {
        return Vec3();
    }

    const double sigma6 = std::pow(cfg.sigma, 6);
    const double sigma12 = sigma6 * sigma6;
    const double forceMagnitude = 24.0 * cfg.epsilon *
        (2.0 * sigma12 / std::pow(rMag, 13) - sigma6 / std::pow(rMag, 7));

    return r * (forceMagnitude / rMag);
}

double lennardJonesPotential(double r, const SimulationConfig& cfg)
{
    if (r == 0.0 || r > cfg.cutoffRadius) {
        return 0.0;
    }
    const double sr6 = std::pow(cfg.sigma / r, 6);
    return 4.0 * cfg.epsilon * (sr6 * sr6 - sr6);
}

void computeForces(const Particles& p, const SimulationConfig& cfg, ForceField& forces)
{
    const size_t n = p.n;
    forces.assign(n, Vec3());

    // O(N^2) over unordered pairs; one evaluation feeds both accumulators
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            const Vec3 r = p[j].position - p[i].position;
            const Vec3 f = lennardJonesForce(r, cfg);
            forces[i] += f;
            forces[j] -= f;
        }
    }
}

ForceField computeForces(const Particles& p, const SimulationConfig& cfg)
{
    ForceField forces;
    computeForces(p, cfg, forces);
    return forces;
}

double computePotentialEnergy(const Particles& p, const SimulationConfig& cfg)
{
    double totalPotential = 0.0;
    for (size_t i = 0; i < p.n; ++i) {
        for (size_t j = i + 1; j < p.n; ++j) {
            const double dist = (p[j].position - p[i].position).length();
            totalPotential += lennardJonesPotential(dist, cfg);
        }
    }
    return totalPotential;
}

double computeKineticEnergy(const Particles& p, const SimulationConfig& cfg)
{
    double totalKinetic = 0.0;
    for (const Particle& particle : p) {
        totalKinetic += 0.5 * cfg.mass * particle.velocity.lengthSquared();
    }
    return totalKinetic;
}
