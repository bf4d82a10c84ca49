#pragma once

#include <cstdint>
#include <string>

// Physical and numerical constants of one run. Filled once, then passed by
// const reference to the force evaluator, integrator and boundary enforcer.
struct SimulationConfig {
    double dt = 0.005;           // integration timestep
    long numSteps = 500;         // number of steps to integrate
    int numParticles = 10;       // ensemble size
    double boxSize = 10.0;       // edge length L of the cubic box [0, L]^3
    double epsilon = 1.0;        // LJ well depth
    double sigma = 1.0;          // LJ characteristic length
    double mass = 1.0;           // mass of every particle
    double cutoffRadius = 2.5;   // pairs farther apart than this do not interact
    std::uint32_t seed = 42;     // seed of the initializer's generator

    // Throws ConfigError when any constant is physically meaningless.
    void validate() const;

    // "# key: value" lines describing the constants, for output metadata
    std::string describe() const;
};
