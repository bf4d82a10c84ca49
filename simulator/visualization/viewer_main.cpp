#include "VisualizationUtils.h"
#include "TrajectoryReader.hpp"
#include "Errors.hpp"
#include <iostream>
#include <chrono>
#include <algorithm>
#include <string>

namespace {
    constexpr int EXIT_USAGE_ERROR = 1;
    constexpr int EXIT_OUTPUT_ERROR = 2;

    constexpr double FRAME_INTERVAL = 0.05;  // seconds, 20 frames per second

    // Smallest box that holds every recorded position
    double inferBoxSize(const TrajectoryData& data) {
        double maxCoord = 0.0;
        for (double value : data.positions) {
            maxCoord = std::max(maxCoord, value);
        }
        return (maxCoord > 0.0) ? maxCoord : 1.0;
    }
}

int main(int argc, char* argv[])
{
    std::string trajectoryPath = (argc > 1) ? argv[1] : "trajectories.npy";

    TrajectoryData data;
    double boxSize = 0.0;

    // Optional box size; inferred from the data when absent
    if (argc > 2) {
        try {
            boxSize = std::stod(argv[2]);
        } catch (const std::logic_error &) {
            std::cerr << "Error: invalid box size '" << argv[2] << "'\n";
            return EXIT_USAGE_ERROR;
        }
        if (!(boxSize > 0.0)) {
            std::cerr << "Error: box size must be positive, got " << argv[2] << "\n";
            return EXIT_USAGE_ERROR;
        }
    }

    try
    {
        data = readTrajectoryNpy(trajectoryPath);
    }
    catch (const TrajectoryNotFoundError &ex)
    {
        std::cerr << "Error: " << ex.path() << " not found! Run the simulation first.\n";
        return EXIT_USAGE_ERROR;
    }
    catch (const OutputError &ex)
    {
        std::cerr << "Error: " << ex.what() << "\n";
        return EXIT_OUTPUT_ERROR;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Error: could not load " << trajectoryPath << ": " << ex.what() << "\n";
        return EXIT_OUTPUT_ERROR;
    }

    if (boxSize == 0.0) {
        boxSize = inferBoxSize(data);
    }

    if (data.numTimeSteps == 0 || data.numParticles == 0) {
        std::cerr << "Error: " << trajectoryPath << " holds no frames to display.\n";
        return EXIT_OUTPUT_ERROR;
    }

    std::cout << "Loaded " << trajectoryPath << ": " << data.numTimeSteps << " frames, "
              << data.numParticles << " particles, box " << boxSize << "\n";

    int numParticles = static_cast<int>(data.numParticles);
    if (!VisualizationUtils::initVisualization(numParticles, static_cast<float>(boxSize))) {
        std::cerr << "Error: could not open the viewer window\n";
        return EXIT_OUTPUT_ERROR;
    }

    VisualizationUtils::setupKeyboardCallback();
    VisualizationUtils::printKeyboardControls();
    VisualizationUtils::totalFrames = static_cast<long>(data.numTimeSteps);
    VisualizationUtils::currentFrame = 0;

    const size_t frameStride = data.numParticles * 3;
    auto lastFrameTime = std::chrono::high_resolution_clock::now();
    auto lastTitleTime = lastFrameTime;
    int framesRendered = 0;

    // Main loop: advance at a fixed frame rate, render every iteration
    while (!glfwWindowShouldClose(VisualizationUtils::window))
    {
        auto now = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double> sinceFrame = now - lastFrameTime;
        if (!VisualizationUtils::paused && sinceFrame.count() >= FRAME_INTERVAL) {
            VisualizationUtils::stepFrame(1);
            lastFrameTime = now;
        }

        const double* frame = data.positions.data() + VisualizationUtils::currentFrame * frameStride;
        VisualizationUtils::renderer->updatePositions(frame, numParticles);
        VisualizationUtils::renderer->render();
        framesRendered++;

        // Refresh the title twice a second
        std::chrono::duration<double> sinceTitle = now - lastTitleTime;
        if (sinceTitle.count() >= 0.5) {
            VisualizationUtils::updateWindowTitle(VisualizationUtils::currentFrame,
                                                  VisualizationUtils::totalFrames,
                                                  framesRendered / sinceTitle.count());
            framesRendered = 0;
            lastTitleTime = now;
        }

        glfwSwapBuffers(VisualizationUtils::window);
        glfwPollEvents();
    }

    VisualizationUtils::cleanupVisualization();
    return 0;
}
