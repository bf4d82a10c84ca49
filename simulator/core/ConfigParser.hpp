#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "Initializer.hpp"
#include "OutputModes.hpp"
#include "SimulationConfig.hpp"

using json = nlohmann::json;

// Structure to hold all configuration parameters
struct Config {
    std::string initSelected;
    json initParams;
    int threads = 1;
    SimulationConfig sim;
    std::string outputDir;
    std::string outputFile;
    OutputMode outputMode = OutputMode::FILE_NPY;
};

// Parse the JSON configuration file. Throws ConfigError on I/O, syntax,
// missing keys, wrong types or unknown enum strings.
Config parseConfig(const std::string& path);

// Same as parseConfig for an already loaded document
Config parseConfigJson(const json& j);

// Build the initial ensemble selected by cfg.initSelected.
// For RANDOM, cfg.sim.numParticles gives the ensemble size.
InitResult createInitializerFromConfig(const Config& cfg);

std::string outputModeName(OutputMode mode);
