#include "OutputUtils.hpp"
#include "OutputData.hpp"
#include "NpyFormat.hpp"
#include "Errors.hpp"
#include <fstream>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <vector>

void flushNPYOutput(const OutputData &outputData, const std::string &filename)
{
    std::ofstream npyFile(filename, std::ios::binary);
    if (!npyFile) {
        throw OutputError("Could not open trajectory file " + filename + " for writing");
    }

    std::ostringstream dict;
    dict << "{'descr': '" << npy::float64Descr << "', 'fortran_order': False, 'shape': ("
         << outputData.numTimeSteps << ", " << outputData.numParticles << ", "
         << OutputData::valuesPerParticle << "), }";
    std::string header = dict.str();

    // Pad so that the data section starts on an aligned offset
    size_t unpadded = npy::preambleSize + header.size() + 1;
    size_t padding = (npy::headerAlignment - unpadded % npy::headerAlignment) % npy::headerAlignment;
    header.append(padding, ' ');
    header.push_back('\n');

    const unsigned char version[2] = {1, 0};
    const unsigned char headerLen[2] = {
        static_cast<unsigned char>(header.size() & 0xFFu),
        static_cast<unsigned char>((header.size() >> 8) & 0xFFu)
    };

    npyFile.write(npy::magic, npy::magicSize);
    npyFile.write(reinterpret_cast<const char*>(version), 2);
    npyFile.write(reinterpret_cast<const char*>(headerLen), 2);
    npyFile.write(header.data(), static_cast<std::streamsize>(header.size()));

    std::vector<unsigned char> bytes(outputData.positions.size() * 8);
    for (size_t i = 0; i < outputData.positions.size(); ++i) {
        npy::encodeDouble(outputData.positions[i], &bytes[i * 8]);
    }
    npyFile.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));

    npyFile.close();
    if (!npyFile) {
        throw OutputError("Failed while writing trajectory file " + filename);
    }
    std::cout << "NPY output written to " << filename << "\n";
}

void flushCSVOutput(const OutputData &outputData,
                   const std::string &filename,
                   const std::string &metadata)
{
    std::ofstream csvFile(filename);
    if (!csvFile) {
        throw OutputError("Could not open CSV file " + filename + " for writing");
    }

    csvFile << metadata;
    csvFile << "particle_id,time,x,y,z,vx,vy,vz,kinetic,potential,total\n";

    for (size_t t = 0; t < outputData.numTimeSteps; ++t) {
        double time = outputData.time(t);
        double kinetic = outputData.kineticEnergy(t);
        double potential = outputData.potentialEnergy(t);

        for (size_t p = 0; p < outputData.numParticles; ++p) {
            Vec3 pos = outputData.position(t, p);
            Vec3 vel = outputData.velocity(t, p);

            csvFile << p << ","
                    << std::fixed << std::setprecision(8)
                    << time << ","
                    << pos.x << "," << pos.y << "," << pos.z << ","
                    << vel.x << "," << vel.y << "," << vel.z << ","
                    << std::setprecision(15)
                    << kinetic << "," << potential << "," << (kinetic + potential) << "\n";
        }
    }

    csvFile.close();
    if (!csvFile) {
        throw OutputError("Failed while writing CSV file " + filename);
    }
    std::cout << "CSV output written to " << filename << "\n";
}

void printProgressBar(long currentStep, long totalSteps)
{
    double progress = (totalSteps == 0) ? 1.0 : static_cast<double>(currentStep) / totalSteps;
    int barWidth = 50;
    int pos = static_cast<int>(barWidth * progress);
    std::cout << "\r[";
    for (int j = 0; j < barWidth; ++j) {
        if (j < pos) std::cout << "=";
        else if (j == pos) std::cout << ">";
        else std::cout << " ";
    }
    std::cout << "] " << int(progress * 100.0) << " %";
    std::cout.flush();
}
