#include "System.hpp"
#include "ConfigParser.hpp"
#include "Errors.hpp"
#include <iostream>
#include <filesystem>
#include <chrono>
#include <cmath>
#include <omp.h>
#include <iomanip>

namespace {
    // Exit codes: configuration problems and persistence failures are
    // distinguishable from success and from each other.
    constexpr int EXIT_CONFIG_ERROR = 1;
    constexpr int EXIT_OUTPUT_ERROR = 2;
    constexpr int EXIT_RUN_ERROR = 3;
}

int main(int argc, char* argv[])
{
    std::string configPath = (argc > 1) ? argv[1] : "config.json";

    try
    {
        // Load configuration from JSON file
        Config cfg = parseConfig(configPath);

        // Set the number of threads for OpenMP
        omp_set_num_threads(cfg.threads);
        std::cout << "OpenMP is configured to use " << cfg.threads << " threads.\n";

        auto init_start = std::chrono::high_resolution_clock::now();

        InitResult result = createInitializerFromConfig(cfg);

        auto init_end = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double> init_elapsed = init_end - init_start;
        std::cout << "Initialization time: " << init_elapsed.count() << " seconds\n";

        // System validates the constants against the real ensemble size
        System sys(std::move(result.particles), cfg.sim, cfg.outputMode);
        const SimulationConfig& sim = sys.getConfig();

        std::string metadata = sim.describe() + result.metadata;
        metadata += "# integration method: Velocity Verlet\n";
        metadata += "# boundaries: reflective [0, " + std::to_string(sim.boxSize) + "]^3\n";
        metadata += "# output mode: " + outputModeName(cfg.outputMode) + "\n";

        std::filesystem::path outputPath = std::filesystem::path(cfg.outputDir) / cfg.outputFile;
        if (outputPath.has_parent_path() && !std::filesystem::exists(outputPath.parent_path())) {
            std::error_code ec;
            std::filesystem::create_directories(outputPath.parent_path(), ec);
            if (ec) {
                throw OutputError("Cannot create output directory " +
                                  outputPath.parent_path().string() + ": " + ec.message());
            }
        }

        // Output some relevant information
        std::cout << "Initialization mode: " << cfg.initSelected << "\n";
        std::cout << "Particles: " << sim.numParticles << ", steps: " << sim.numSteps
                  << ", dt: " << sim.dt << ", box: " << sim.boxSize << "\n";
        std::cout << "Output: " << outputPath.string() << " (" << outputModeName(cfg.outputMode) << ")\n";

        double initialEnergy = sys.computeTotalEnergy();

        auto start = std::chrono::high_resolution_clock::now();
        sys.runSimulation(outputPath.string(), metadata);
        auto end = std::chrono::high_resolution_clock::now();

        std::chrono::duration<double> elapsed = end - start;
        double finalEnergy = sys.computeTotalEnergy();

        std::cout << "Simulation time: " << elapsed.count() << " seconds\n";
        std::cout << std::setprecision(10)
                  << "Total energy: initial " << initialEnergy << ", final " << finalEnergy;
        if (initialEnergy != 0.0) {
            std::cout << " (relative drift " << std::scientific << std::setprecision(3)
                      << (finalEnergy - initialEnergy) / std::fabs(initialEnergy) << ")";
        }
        std::cout << std::defaultfloat << "\n";
        std::cout << "Wall reflections: " << sys.getWallReflections() << "\n";

        return 0;
    }
    catch (const ConfigError &ex)
    {
        std::cerr << "Configuration error: " << ex.what() << "\n";
        return EXIT_CONFIG_ERROR;
    }
    catch (const OutputError &ex)
    {
        std::cerr << "\nOutput error: " << ex.what() << "\n";
        return EXIT_OUTPUT_ERROR;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Error: " << ex.what() << "\n";
        return EXIT_RUN_ERROR;
    }
}
