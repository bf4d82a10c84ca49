#include "System.hpp"
#include "Boundary.hpp"
#include "Integrator.hpp"
#include <iostream>
#include <stdexcept>

const char* runStateName(RunState state)
{
    switch (state) {
        case RunState::UNINITIALIZED: return "Uninitialized";
        case RunState::INITIALIZED:   return "Initialized";
        case RunState::RUNNING:       return "Running";
        case RunState::COMPLETED:     return "Completed";
    }
    return "Unknown";
}

System::System(Particles&& p, const SimulationConfig& cfg, OutputMode outMode)
    : particles(std::move(p)), config(cfg), outputMode(outMode)
{
    config.numParticles = static_cast<int>(particles.n);
    config.validate();

    // Buffer for the whole run is allocated up front; the step loop never grows it
    trajectory = OutputData(particles.n, static_cast<size_t>(config.numSteps));
    newForces.assign(particles.n, Vec3());
    state = RunState::INITIALIZED;
}

double System::computeKineticEnergy() const
{
    return ::computeKineticEnergy(particles, config);
}

double System::computePotentialEnergy() const
{
    return ::computePotentialEnergy(particles, config);
}

void System::performIntegrationStep()
{
    const long n = static_cast<long>(particles.n);
    const double boxSize = config.boxSize;
    long reflections = 0;

    // Position half-step and wall enforcement; each particle is independent.
    // The end of every parallel loop is a barrier between phases.
    #pragma omp parallel for reduction(+:reflections) schedule(static)
    for (long i = 0; i < n; ++i) {
        updatePosition(particles[i], config);
        reflections += enforceBoundaries(particles[i], boxSize);
    }

    // Pair forces on the corrected positions, single-threaded
    computeForces(particles, config, newForces);

    #pragma omp parallel for schedule(static)
    for (long i = 0; i < n; ++i) {
        updateVelocity(particles[i], newForces[i], config);
    }

    m_wallReflections += reflections;
    ++m_completedSteps;
}

void System::recordSnapshot(size_t timeIdx)
{
    for (size_t p = 0; p < particles.n; ++p) {
        trajectory.setParticleData(p, timeIdx, particles[p]);
    }
    trajectory.setSystemData(timeIdx, getSimulationTime(),
                             computeKineticEnergy(), computePotentialEnergy());
}

void System::integrate(bool showProgress)
{
    if (state != RunState::INITIALIZED) {
        throw std::runtime_error(std::string("Cannot start a run in state ") + runStateName(state));
    }

    state = RunState::RUNNING;
    const long steps = config.numSteps;
    for (long step = 0; step < steps; ++step) {
        performIntegrationStep();
        recordSnapshot(static_cast<size_t>(step));

        if (showProgress) {
            printProgressBar(step + 1, steps);
        }
    }
    if (showProgress) {
        std::cout << "\n";
    }
    state = RunState::COMPLETED;
}

void System::writeTrajectory(const std::string &outputFilename, const std::string &metadata) const
{
    if (state != RunState::COMPLETED) {
        throw std::runtime_error("Trajectory can only be written after the run has completed");
    }

    switch (outputMode) {
        case OutputMode::FILE_NPY:
            flushNPYOutput(trajectory, outputFilename);
            break;
        case OutputMode::FILE_CSV:
            flushCSVOutput(trajectory, outputFilename, metadata);
            break;
    }
}

void System::runSimulation(const std::string &outputFilename, const std::string &metadata)
{
    integrate(true);
    writeTrajectory(outputFilename, metadata);
}
