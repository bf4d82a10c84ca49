#pragma once

#include <GL/glew.h>
#include <GLFW/glfw3.h>
#include <string>
#include "ParticleRenderer.h"

// Window, input and playback state shared by the trajectory viewer
namespace VisualizationUtils
{
    // Window and renderer state
    extern GLFWwindow* window;
    extern int windowWidth;
    extern int windowHeight;
    extern bool visualizationInitialized;
    extern ParticleRenderer* renderer;

    // Playback state
    extern bool paused;
    extern long currentFrame;
    extern long totalFrames;

    // Initialization and cleanup
    bool initVisualization(int particleCount, float boxSize, const char* windowTitle = "LJ Box Viewer");
    void cleanupVisualization();

    // Mouse callbacks - must be set up by the caller
    void mouse_button_callback(GLFWwindow* window, int button, int action, int mods);
    void cursor_position_callback(GLFWwindow* window, double xpos, double ypos);
    void scroll_callback(GLFWwindow* window, double xoffset, double yoffset);

    // Keyboard callback - must be set by the caller
    void setupKeyboardCallback();

    // Moves the playback cursor by delta frames, wrapping around
    void stepFrame(long delta);

    // Help display
    void printKeyboardControls();

    // Window title updates
    void updateWindowTitle(long frame, long frames, double fps);
}
