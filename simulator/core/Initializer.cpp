#include "Initializer.hpp"
#include "Errors.hpp"
#include <random>
#include <sstream>
#include <stdexcept>
#include <fstream>
#include <vector>
#include <array>

using namespace std;

//------------------------------------------------------------------------------
// initRandomParticles:
// Draws, per particle, three position components then three velocity
// components from one mt19937 stream. Keeping the margin away from the walls
// avoids particles starting on a boundary.
InitResult Initializer::initRandomParticles(
    int n,
    double L,
    double margin,
    double maxVelocity,
    uint32_t seed
) {
    if (n < 1)
        throw ConfigError("Random initializer needs at least one particle");
    if (margin < 0.0 || maxVelocity < 0.0)
        throw ConfigError("Random initializer margin and maxVelocity must be >= 0");
    if (L <= 2.0 * margin) {
        ostringstream msg;
        msg << "Box size " << L << " leaves no room for placement margin " << margin;
        throw ConfigError(msg.str());
    }

    Particles p(n);
    mt19937 gen(seed);

    uniform_real_distribution<double> posDist(margin, L - margin);
    uniform_real_distribution<double> velDist(-maxVelocity, maxVelocity);

    for (int i = 0; i < n; ++i) {
        // Separate statements keep the draw order fixed
        double px = posDist(gen);
        double py = posDist(gen);
        double pz = posDist(gen);
        double vx = velDist(gen);
        double vy = velDist(gen);
        double vz = velDist(gen);

        p.setParticle(i, px, py, pz, vx, vy, vz);
    }

    ostringstream metadata;
    metadata << "# Initializer: Random\n";
    metadata << "# Position range: [" << margin << ", " << L - margin << "]\n";
    metadata << "# Velocity range: [-" << maxVelocity << ", " << maxVelocity << "]\n";
    metadata << "# Seed: " << seed << "\n";
    metadata << "# Total particle count: " << p.n << "\n";

    return {p, metadata.str()};
}

InitResult Initializer::initFromFile(const string &filePath)
{
    ifstream file(filePath);
    if (!file)
        throw ConfigError("Cannot open particle file: " + filePath);

    vector<array<double, 6>> rows;
    string line;
    int lineNumber = 0;
    while (getline(file, line)) {
        ++lineNumber;
        size_t first = line.find_first_not_of(" \t\r");
        if (first == string::npos || line[first] == '#')
            continue;

        istringstream fields(line);
        array<double, 6> row;
        for (double &value : row) {
            if (!(fields >> value)) {
                throw ConfigError("Malformed particle at " + filePath + ":" +
                                  to_string(lineNumber) + " (expected px py pz vx vy vz)");
            }
        }
        rows.push_back(row);
    }

    if (rows.empty())
        throw ConfigError("Particle file contains no particles: " + filePath);

    Particles p(rows.size());
    for (size_t i = 0; i < rows.size(); ++i) {
        const array<double, 6> &r = rows[i];
        p.setParticle(i, r[0], r[1], r[2], r[3], r[4], r[5]);
    }

    ostringstream metaStream;
    metaStream << "# Initializer: From file\n"
               << "# filePath: " << filePath << "\n"
               << "# Total particle count: " << p.n << "\n";

    return {p, metaStream.str()};
}
