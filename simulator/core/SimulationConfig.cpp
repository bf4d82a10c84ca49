#include "SimulationConfig.hpp"
#include "Errors.hpp"
#include <cmath>
#include <sstream>

namespace {
    void requireFinite(double value, const char* name) {
        if (!std::isfinite(value)) {
            throw ConfigError(std::string(name) + " must be a finite number");
        }
    }

    void requirePositive(double value, const char* name) {
        requireFinite(value, name);
        if (value <= 0.0) {
            std::ostringstream msg;
            msg << name << " must be > 0 (got " << value << ")";
            throw ConfigError(msg.str());
        }
    }
}

void SimulationConfig::validate() const
{
    requirePositive(dt, "dt");
    requirePositive(boxSize, "box size");
    requirePositive(epsilon, "epsilon");
    requirePositive(sigma, "sigma");
    requirePositive(mass, "mass");

    if (numParticles < 1) {
        throw ConfigError("particle count must be >= 1 (got " + std::to_string(numParticles) + ")");
    }
    if (numSteps < 0) {
        throw ConfigError("step count must be >= 0 (got " + std::to_string(numSteps) + ")");
    }

    requireFinite(cutoffRadius, "cutoff radius");
    if (cutoffRadius < 0.0) {
        std::ostringstream msg;
        msg << "cutoff radius must be >= 0 (got " << cutoffRadius << ")";
        throw ConfigError(msg.str());
    }
}

std::string SimulationConfig::describe() const
{
    std::ostringstream meta;
    meta << "# dt: " << dt << "\n"
         << "# steps: " << numSteps << "\n"
         << "# particles: " << numParticles << "\n"
         << "# box size: " << boxSize << "\n"
         << "# epsilon: " << epsilon << "\n"
         << "# sigma: " << sigma << "\n"
         << "# mass: " << mass << "\n"
         << "# cutoff radius: " << cutoffRadius << "\n"
         << "# seed: " << seed << "\n";
    return meta.str();
}
