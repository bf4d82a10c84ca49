#include <gtest/gtest.h>
#include "ConfigParser.hpp"
#include "Errors.hpp"
#include <filesystem>
#include <fstream>
#include <limits>
#include <cmath>

namespace {
    json baseConfig() {
        return json::parse(R"({
            "threads": 2,
            "seed": 7,
            "dt": 0.002,
            "steps": 100,
            "box": 12.0,
            "mass": 1.5,
            "potential": { "epsilon": 0.8, "sigma": 1.2 },
            "init": {
                "selected": "RANDOM",
                "RANDOM": { "nParticles": 16, "margin": 1.0, "maxVelocity": 0.5 },
                "FROM_FILE": { "filePath": "particles.dat" }
            },
            "output": { "dir": "out/", "file": "run.npy" },
            "outputMode": "FILE_NPY"
        })");
    }
}

TEST(ConfigParser, ReadsAllKeys) {
    Config cfg = parseConfigJson(baseConfig());

    EXPECT_EQ(cfg.threads, 2);
    EXPECT_EQ(cfg.sim.seed, 7u);
    EXPECT_DOUBLE_EQ(cfg.sim.dt, 0.002);
    EXPECT_EQ(cfg.sim.numSteps, 100);
    EXPECT_DOUBLE_EQ(cfg.sim.boxSize, 12.0);
    EXPECT_DOUBLE_EQ(cfg.sim.mass, 1.5);
    EXPECT_DOUBLE_EQ(cfg.sim.epsilon, 0.8);
    EXPECT_DOUBLE_EQ(cfg.sim.sigma, 1.2);
    EXPECT_EQ(cfg.sim.numParticles, 16);
    EXPECT_EQ(cfg.initSelected, "RANDOM");
    EXPECT_EQ(cfg.outputDir, "out/");
    EXPECT_EQ(cfg.outputFile, "run.npy");
    EXPECT_EQ(cfg.outputMode, OutputMode::FILE_NPY);
}

TEST(ConfigParser, CutoffDefaultsToTwoAndAHalfSigma) {
    Config cfg = parseConfigJson(baseConfig());
    EXPECT_DOUBLE_EQ(cfg.sim.cutoffRadius, 2.5 * 1.2);

    json j = baseConfig();
    j["potential"]["cutoff"] = 3.0;
    EXPECT_DOUBLE_EQ(parseConfigJson(j).sim.cutoffRadius, 3.0);
}

TEST(ConfigParser, CsvOutputMode) {
    json j = baseConfig();
    j["outputMode"] = "FILE_CSV";
    EXPECT_EQ(parseConfigJson(j).outputMode, OutputMode::FILE_CSV);
    EXPECT_EQ(outputModeName(OutputMode::FILE_CSV), "CSV File");
}

TEST(ConfigParser, UnknownEnumsAreRejected) {
    json j = baseConfig();
    j["outputMode"] = "FILE_HDF5";
    EXPECT_THROW(parseConfigJson(j), ConfigError);

    j = baseConfig();
    j["init"]["selected"] = "LATTICE";
    EXPECT_THROW(parseConfigJson(j), ConfigError);
}

TEST(ConfigParser, MissingOrMistypedKeysAreConfigErrors) {
    json j = baseConfig();
    j.erase("dt");
    EXPECT_THROW(parseConfigJson(j), ConfigError);

    j = baseConfig();
    j["steps"] = "many";
    EXPECT_THROW(parseConfigJson(j), ConfigError);

    j = baseConfig();
    j["potential"].erase("sigma");
    EXPECT_THROW(parseConfigJson(j), ConfigError);
}

TEST(ConfigParser, PhysicallyInvalidValuesAreRejected) {
    json j = baseConfig();
    j["dt"] = 0.0;
    EXPECT_THROW(parseConfigJson(j), ConfigError);

    j = baseConfig();
    j["box"] = -5.0;
    EXPECT_THROW(parseConfigJson(j), ConfigError);

    j = baseConfig();
    j["init"]["RANDOM"]["nParticles"] = 0;
    EXPECT_THROW(parseConfigJson(j), ConfigError);

    j = baseConfig();
    j["potential"]["cutoff"] = -1.0;
    EXPECT_THROW(parseConfigJson(j), ConfigError);

    j = baseConfig();
    j["threads"] = 0;
    EXPECT_THROW(parseConfigJson(j), ConfigError);
}

TEST(ConfigParser, MissingFileAndBadSyntax) {
    EXPECT_THROW(parseConfig("does_not_exist_ljbox.json"), ConfigError);

    std::filesystem::path path = std::filesystem::temp_directory_path() / "ljbox_bad_config.json";
    {
        std::ofstream out(path);
        out << "{ \"dt\": 0.005, ";
    }
    EXPECT_THROW(parseConfig(path.string()), ConfigError);
    std::filesystem::remove(path);
}

TEST(ConfigParser, RandomInitializerFromConfig) {
    Config cfg = parseConfigJson(baseConfig());
    InitResult result = createInitializerFromConfig(cfg);

    EXPECT_EQ(result.particles.n, 16u);
    for (const Particle& particle : result.particles) {
        EXPECT_GE(particle.position.x, 1.0);
        EXPECT_LE(particle.position.x, 11.0);
        EXPECT_LE(std::abs(particle.velocity.y), 0.5);
    }
}

TEST(SimulationConfig, DefaultsAreValid) {
    SimulationConfig cfg;
    EXPECT_NO_THROW(cfg.validate());
    EXPECT_DOUBLE_EQ(cfg.dt, 0.005);
    EXPECT_EQ(cfg.numSteps, 500);
    EXPECT_EQ(cfg.numParticles, 10);
    EXPECT_DOUBLE_EQ(cfg.boxSize, 10.0);
    EXPECT_DOUBLE_EQ(cfg.cutoffRadius, 2.5);
}

TEST(SimulationConfig, ValidateRejectsEachBadConstant) {
    SimulationConfig cfg;
    cfg.sigma = 0.0;
    EXPECT_THROW(cfg.validate(), ConfigError);

    cfg = SimulationConfig();
    cfg.epsilon = -1.0;
    EXPECT_THROW(cfg.validate(), ConfigError);

    cfg = SimulationConfig();
    cfg.mass = std::numeric_limits<double>::infinity();
    EXPECT_THROW(cfg.validate(), ConfigError);

    cfg = SimulationConfig();
    cfg.dt = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(cfg.validate(), ConfigError);

    cfg = SimulationConfig();
    cfg.numSteps = -1;
    EXPECT_THROW(cfg.validate(), ConfigError);

    cfg = SimulationConfig();
    cfg.cutoffRadius = 0.0;
    EXPECT_NO_THROW(cfg.validate());
}

TEST(SimulationConfig, DescribeListsConstants) {
    SimulationConfig cfg;
    std::string text = cfg.describe();
    EXPECT_NE(text.find("# dt: 0.005"), std::string::npos);
    EXPECT_NE(text.find("# particles: 10"), std::string::npos);
    EXPECT_NE(text.find("# seed: 42"), std::string::npos);
}

TEST(ConfigParser, IntegerKeysRejectFractionsAndNegatives) {
    json j = baseConfig();
    j["seed"] = -1;
    EXPECT_THROW(parseConfigJson(j), ConfigError);

    j = baseConfig();
    j["seed"] = 4294967296ull;
    EXPECT_THROW(parseConfigJson(j), ConfigError);

    j = baseConfig();
    j["steps"] = 1e30;
    EXPECT_THROW(parseConfigJson(j), ConfigError);

    j = baseConfig();
    j["steps"] = 10.5;
    EXPECT_THROW(parseConfigJson(j), ConfigError);

    j = baseConfig();
    j["steps"] = -3;
    EXPECT_THROW(parseConfigJson(j), ConfigError);

    j = baseConfig();
    j["init"]["RANDOM"]["nParticles"] = 2.5;
    EXPECT_THROW(parseConfigJson(j), ConfigError);
}

TEST(ConfigParser, SeedAcceptsFullUnsignedRange) {
    json j = baseConfig();
    j["seed"] = 4294967295ull;
    EXPECT_EQ(parseConfigJson(j).sim.seed, 4294967295u);

    j.erase("seed");
    EXPECT_EQ(parseConfigJson(j).sim.seed, 42u);
}
