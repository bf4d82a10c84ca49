#include "ConfigParser.hpp"
#include "Errors.hpp"
#include <fstream>
#include <cstdint>
#include <limits>

namespace {
    // Integer-valued key in [minValue, maxValue]; floats and out-of-range
    // values are rejected before any narrowing conversion.
    long long integerField(const json& value, const std::string& key,
                           long long minValue, long long maxValue) {
        if (!value.is_number_integer()) {
            throw ConfigError(key + " must be an integer (got " + value.dump() + ")");
        }
        if (value.is_number_unsigned()) {
            auto raw = value.get<std::uint64_t>();
            if (raw > static_cast<std::uint64_t>(maxValue)) {
                throw ConfigError(key + " is out of range (got " + value.dump() + ")");
            }
            return static_cast<long long>(raw);
        }
        long long raw = value.get<long long>();
        if (raw < minValue || raw > maxValue) {
            throw ConfigError(key + " is out of range (got " + value.dump() + ")");
        }
        return raw;
    }
}

Config parseConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigError("Failed to open config file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const json::parse_error& ex) {
        throw ConfigError("Invalid JSON in " + path + ": " + ex.what());
    }
    return parseConfigJson(j);
}

Config parseConfigJson(const json& j) {
    Config cfg;

    try {
        // Basic parameters
        if (j.contains("threads")) {
            cfg.threads = static_cast<int>(
                integerField(j.at("threads"), "threads", 1, std::numeric_limits<int>::max()));
        }
        if (j.contains("seed")) {
            cfg.sim.seed = static_cast<std::uint32_t>(
                integerField(j.at("seed"), "seed", 0, std::numeric_limits<std::uint32_t>::max()));
        }
        cfg.sim.dt = j.at("dt").get<double>();
        cfg.sim.numSteps = static_cast<long>(
            integerField(j.at("steps"), "steps", 0, std::numeric_limits<long>::max()));
        cfg.sim.boxSize = j.at("box").get<double>();
        cfg.sim.mass = j.value("mass", 1.0);

        // Potential parameters; the cutoff defaults to 2.5 sigma
        const json& potential = j.at("potential");
        cfg.sim.epsilon = potential.at("epsilon").get<double>();
        cfg.sim.sigma = potential.at("sigma").get<double>();
        cfg.sim.cutoffRadius = potential.value("cutoff", 2.5 * cfg.sim.sigma);

        cfg.initSelected = j.at("init").at("selected").get<std::string>();
        cfg.initParams = j.at("init").value(cfg.initSelected, json::object());

        cfg.outputDir = j.at("output").value("dir", std::string("./"));
        cfg.outputFile = j.at("output").value("file", std::string("trajectories.npy"));

        std::string output = j.value("outputMode", std::string("FILE_NPY"));
        if (output == "FILE_NPY") {
            cfg.outputMode = OutputMode::FILE_NPY;
        } else if (output == "FILE_CSV") {
            cfg.outputMode = OutputMode::FILE_CSV;
        } else {
            throw ConfigError("Unknown output mode: " + output);
        }

        if (cfg.initSelected == "RANDOM") {
            cfg.sim.numParticles = static_cast<int>(integerField(
                cfg.initParams.at("nParticles"), "nParticles", 1, std::numeric_limits<int>::max()));
        } else if (cfg.initSelected != "FROM_FILE") {
            throw ConfigError("Unknown initialization method: " + cfg.initSelected);
        }
    } catch (const json::exception& ex) {
        throw ConfigError(std::string("Invalid configuration: ") + ex.what());
    }

    // For FROM_FILE the particle count is only known after loading; System
    // validates again with the real ensemble size.
    cfg.sim.validate();
    return cfg;
}

InitResult createInitializerFromConfig(const Config& cfg) {
    InitResult result;

    try {
        if (cfg.initSelected == "RANDOM") {
            double margin = cfg.initParams.value("margin", 2.0);
            double maxVelocity = cfg.initParams.value("maxVelocity", 2.0);
            result = Initializer::initRandomParticles(cfg.sim.numParticles, cfg.sim.boxSize,
                                                      margin, maxVelocity, cfg.sim.seed);
        }
        else if (cfg.initSelected == "FROM_FILE") {
            std::string filePath = cfg.initParams.at("filePath").get<std::string>();
            result = Initializer::initFromFile(filePath);
        }
        else {
            throw ConfigError("Unknown initialization method: " + cfg.initSelected);
        }
    } catch (const json::exception& ex) {
        throw ConfigError(std::string("Invalid initializer parameters: ") + ex.what());
    }

    return result;
}

std::string outputModeName(OutputMode mode) {
    switch (mode) {
        case OutputMode::FILE_NPY:
            return "NPY File";
        case OutputMode::FILE_CSV:
            return "CSV File";
    }
    return "Unknown";
}
