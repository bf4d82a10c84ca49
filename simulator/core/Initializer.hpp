#pragma once
#include <cstdint>
#include <string>
#include "Particles.hpp"

enum class InitializerMethod {
    RANDOM,
    FROM_FILE
};

// Structure to hold initialization result and metadata
struct InitResult {
    Particles particles;
    std::string metadata;
};

class Initializer {
public:
    // n particles with positions uniform in [margin, L - margin]^3 and velocity
    // components uniform in [-maxVelocity, maxVelocity]. The generator is seeded
    // with 'seed' only, so the same arguments always give the same ensemble.
    static InitResult initRandomParticles(int n,
                                          double L,
                                          double margin,
                                          double maxVelocity,
                                          std::uint32_t seed);

    // Reads one particle per line "px py pz vx vy vz"; blank lines and lines
    // starting with '#' are skipped.
    static InitResult initFromFile(const std::string &filePath);
};
