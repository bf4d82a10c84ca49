#pragma once
#include <string>
#include <vector>
#include "Vec3.hpp"

// Position trajectory loaded back from a .npy file
struct TrajectoryData {
    size_t numTimeSteps = 0;
    size_t numParticles = 0;
    std::vector<double> positions;  // (numTimeSteps, numParticles, 3), C order

    Vec3 position(size_t timeIdx, size_t particleIdx) const;
};

// Loads a (steps, particles, 3) little-endian float64 .npy array.
// Throws TrajectoryNotFoundError when the file does not exist and OutputError
// when it is not a trajectory of that shape.
TrajectoryData readTrajectoryNpy(const std::string &filename);
