#pragma once

#include <vector>
#include <stdexcept>
#include "Particles.hpp"

// Trajectory buffer of one run, filled row by row by the driver.
// Row t holds the state right after step t.
struct OutputData {
    // Dense (numTimeSteps, numParticles, 3) arrays in C order
    std::vector<double> positions;
    std::vector<double> velocities;
    static constexpr size_t valuesPerParticle = 3;  // x, y, z

    // One entry per timestep: time, kinetic energy, potential energy
    std::vector<double> systemData;
    static constexpr size_t valuesPerSystem = 3;

    size_t numParticles = 0;
    size_t numTimeSteps = 0;

    OutputData() = default;

    OutputData(size_t particles, size_t timeSteps)
        : positions(particles * timeSteps * valuesPerParticle, 0.0),
          velocities(particles * timeSteps * valuesPerParticle, 0.0),
          systemData(timeSteps * valuesPerSystem, 0.0),
          numParticles(particles),
          numTimeSteps(timeSteps)
    {}

    size_t index(size_t timeIdx, size_t particleIdx) const {
        if (timeIdx >= numTimeSteps || particleIdx >= numParticles)
            throw std::out_of_range("Trajectory index out of range");
        return (timeIdx * numParticles + particleIdx) * valuesPerParticle;
    }

    void setParticleData(size_t particleIdx, size_t timeIdx, const Particle& p) {
        size_t idx = index(timeIdx, particleIdx);
        positions[idx + 0] = p.position.x;
        positions[idx + 1] = p.position.y;
        positions[idx + 2] = p.position.z;
        velocities[idx + 0] = p.velocity.x;
        velocities[idx + 1] = p.velocity.y;
        velocities[idx + 2] = p.velocity.z;
    }

    void setSystemData(size_t timeIdx, double time, double kinetic, double potential) {
        if (timeIdx >= numTimeSteps)
            throw std::out_of_range("Trajectory index out of range");
        systemData[timeIdx * valuesPerSystem + 0] = time;
        systemData[timeIdx * valuesPerSystem + 1] = kinetic;
        systemData[timeIdx * valuesPerSystem + 2] = potential;
    }

    Vec3 position(size_t timeIdx, size_t particleIdx) const {
        size_t idx = index(timeIdx, particleIdx);
        return Vec3(positions[idx], positions[idx + 1], positions[idx + 2]);
    }

    Vec3 velocity(size_t timeIdx, size_t particleIdx) const {
        size_t idx = index(timeIdx, particleIdx);
        return Vec3(velocities[idx], velocities[idx + 1], velocities[idx + 2]);
    }

    double time(size_t timeIdx) const { return systemData.at(timeIdx * valuesPerSystem + 0); }
    double kineticEnergy(size_t timeIdx) const { return systemData.at(timeIdx * valuesPerSystem + 1); }
    double potentialEnergy(size_t timeIdx) const { return systemData.at(timeIdx * valuesPerSystem + 2); }
    double totalEnergy(size_t timeIdx) const { return kineticEnergy(timeIdx) + potentialEnergy(timeIdx); }
};
