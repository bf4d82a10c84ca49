#pragma once
#include <string>

// Forward declarations
struct OutputData;

// Write the position trajectory as a (steps, particles, 3) float64 .npy file.
// Throws OutputError if the file cannot be written.
void flushNPYOutput(const OutputData &outputData, const std::string &filename);

// Write metadata lines followed by one CSV row per particle per timestep.
// Throws OutputError if the file cannot be written.
void flushCSVOutput(const OutputData &outputData,
                    const std::string &filename,
                    const std::string &metadata);

// Progress bar display
void printProgressBar(long currentStep, long totalSteps);
