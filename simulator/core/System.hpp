#pragma once

#include "OutputUtils.hpp"
#include "OutputData.hpp"
#include "OutputModes.hpp"
#include "Particles.hpp"
#include "Forces.hpp"
#include "SimulationConfig.hpp"
#include <string>

// Lifecycle of a run. A completed system never goes back.
enum class RunState {
    UNINITIALIZED,
    INITIALIZED,
    RUNNING,
    COMPLETED
};

class System
{
public:
    // Validates cfg (throws ConfigError) and takes ownership of the ensemble.
    // cfg.numParticles is taken from the ensemble size.
    System(Particles&& p, const SimulationConfig& cfg, OutputMode outMode = OutputMode::FILE_NPY);

    // The trajectory buffer can be large; a run has exactly one owner
    System(const System&) = delete;
    System& operator=(const System&) = delete;

    System(System&& other) noexcept = default;
    System& operator=(System&& other) noexcept = default;

    // Integrate all configured steps, then persist the trajectory to
    // outputFilename. Throws OutputError if persistence fails.
    void runSimulation(const std::string &outputFilename, const std::string &metadata);

    // Integrate all configured steps into the trajectory buffer without
    // persisting. Throws std::runtime_error unless the state is INITIALIZED.
    void integrate(bool showProgress = false);

    // Persist the recorded trajectory in the configured output mode.
    // Only valid once the run is COMPLETED.
    void writeTrajectory(const std::string &outputFilename, const std::string &metadata) const;

    double computeKineticEnergy() const;
    double computePotentialEnergy() const;
    double computeTotalEnergy() const { return computeKineticEnergy() + computePotentialEnergy(); }

    const Particles& getParticles() const { return particles; }
    const SimulationConfig& getConfig() const { return config; }
    const OutputData& getTrajectory() const { return trajectory; }
    RunState getState() const { return state; }
    OutputMode getOutputMode() const { return outputMode; }

    long getCompletedSteps() const { return m_completedSteps; }
    double getSimulationTime() const { return m_completedSteps * config.dt; }
    long getWallReflections() const { return m_wallReflections; }

private:
    // One velocity-Verlet step: positions, walls, forces, velocities
    void performIntegrationStep();
    void recordSnapshot(size_t timeIdx);

    Particles particles;
    SimulationConfig config;
    OutputMode outputMode{OutputMode::FILE_NPY};
    RunState state{RunState::UNINITIALIZED};

    OutputData trajectory;
    ForceField newForces;   // accumulators reused across steps

    long m_completedSteps = 0;
    long m_wallReflections = 0;
};

const char* runStateName(RunState state);
