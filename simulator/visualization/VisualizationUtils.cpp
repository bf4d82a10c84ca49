#include "VisualizationUtils.h"
#include <iostream>
#include <string>
#include <algorithm>

namespace VisualizationUtils
{
    // Global state
    GLFWwindow* window = nullptr;
    int windowWidth = 1280;
    int windowHeight = 720;
    bool visualizationInitialized = false;
    ParticleRenderer* renderer = nullptr;

    bool paused = false;
    long currentFrame = 0;
    long totalFrames = 0;

    // Mouse callback implementations
    void mouse_button_callback(GLFWwindow* window, int button, int action, int mods) {
        if (renderer) {
            renderer->handleMouseButton(button, action);
        }
    }

    void cursor_position_callback(GLFWwindow* window, double xpos, double ypos) {
        if (renderer) {
            renderer->handleMouseMove(xpos, ypos);
        }
    }

    void scroll_callback(GLFWwindow* window, double xoffset, double yoffset) {
        if (renderer) {
            renderer->handleMouseScroll(yoffset);
        }
    }

    bool initVisualization(int particleCount, float boxSize, const char* windowTitle) {
        if (visualizationInitialized) return true;

        if (!glfwInit()) {
            std::cerr << "Failed to initialize GLFW" << std::endl;
            return false;
        }

        // Request a GL 3.3 core context with a depth buffer
        glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
        glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
        glfwWindowHint(GLFW_DOUBLEBUFFER, GLFW_TRUE);
        glfwWindowHint(GLFW_DEPTH_BITS, 24);

        window = glfwCreateWindow(windowWidth, windowHeight, windowTitle, NULL, NULL);
        if (!window) {
            std::cerr << "Failed to create GLFW window" << std::endl;
            glfwTerminate();
            return false;
        }

        glfwMakeContextCurrent(window);
        glfwSwapInterval(1);  // Sync buffer swaps with the display refresh

        // Load GL entry points; core profiles need the experimental flag
        glewExperimental = GL_TRUE;
        GLenum glewError = glewInit();
        if (glewError != GLEW_OK) {
            std::cerr << "GLEW initialization failed: " << glewGetErrorString(glewError) << std::endl;
            glfwDestroyWindow(window);
            window = nullptr;
            glfwTerminate();
            return false;
        }

        std::cout << "OpenGL Version: " << glGetString(GL_VERSION) << std::endl;
        std::cout << "OpenGL Renderer: " << glGetString(GL_RENDERER) << std::endl;

        // glewInit can leave a spurious GL_INVALID_ENUM behind on core profiles
        while (glGetError() != GL_NO_ERROR);

        // Set up callbacks
        glfwSetMouseButtonCallback(window, mouse_button_callback);
        glfwSetCursorPosCallback(window, cursor_position_callback);
        glfwSetScrollCallback(window, scroll_callback);

        glClearColor(0.02f, 0.02f, 0.05f, 1.0f);  // Very dark blue

        // Create renderer
        renderer = new ParticleRenderer();
        if (!renderer->init(particleCount, boxSize)) {
            std::cerr << "Failed to initialize particle renderer" << std::endl;
            delete renderer;
            renderer = nullptr;
            glfwDestroyWindow(window);
            window = nullptr;
            glfwTerminate();
            return false;
        }

        visualizationInitialized = true;
        return true;
    }

    void stepFrame(long delta) {
        if (totalFrames <= 0) return;
        // Double modulo keeps negative steps inside [0, totalFrames)
        currentFrame = ((currentFrame + delta) % totalFrames + totalFrames) % totalFrames;
    }

    void setupKeyboardCallback() {
        glfwSetKeyCallback(window, [](GLFWwindow* window, int key, int scancode, int action, int mods) {
            if (action != GLFW_PRESS && action != GLFW_REPEAT) return;

            const float rotateStep = 0.1f;

            switch (key) {
                case GLFW_KEY_SPACE:
                    // Toggle playback; ignore key repeat so holding Space does not flicker
                    if (action == GLFW_PRESS) {
                        paused = !paused;
                        std::cout << (paused ? "Paused" : "Playing") << " at frame "
                                  << currentFrame << std::endl;
                    }
                    break;
                case GLFW_KEY_LEFT:
                    // Frame stepping only makes sense while paused
                    if (paused) stepFrame(-1);
                    break;
                case GLFW_KEY_RIGHT:
                    if (paused) stepFrame(1);
                    break;
                case GLFW_KEY_R:
                    // Reset camera view
                    if (renderer) {
                        renderer->resetView();
                    }
                    break;
                case GLFW_KEY_P:
                    // Increase point size
                    if (renderer) {
                        renderer->setPointSize(std::min(200.0f, renderer->getPointSize() * 1.5f));
                    }
                    break;
                case GLFW_KEY_O:
                    // Decrease point size
                    if (renderer) {
                        renderer->setPointSize(std::max(1.0f, renderer->getPointSize() / 1.5f));
                    }
                    break;
                case GLFW_KEY_C:
                    // Toggle between one shared color and per-particle colors
                    if (renderer) {
                        ParticleRenderer::ColorMode newMode =
                            (renderer->getColorMode() == ParticleRenderer::ColorMode::UNIFORM) ?
                            ParticleRenderer::ColorMode::PARTICLE_INDEX :
                            ParticleRenderer::ColorMode::UNIFORM;
                        renderer->setColorMode(newMode);
                    }
                    break;
                case GLFW_KEY_X:
                    // Toggle box wireframe
                    if (renderer) {
                        renderer->toggleBox();
                    }
                    break;
                // WASD rotation controls
                case GLFW_KEY_W:
                    if (renderer) renderer->rotateCamera(-rotateStep, 0.0f);
                    break;
                case GLFW_KEY_S:
                    if (renderer) renderer->rotateCamera(rotateStep, 0.0f);
                    break;
                case GLFW_KEY_A:
                    if (renderer) renderer->rotateCamera(0.0f, -rotateStep);
                    break;
                case GLFW_KEY_D:
                    if (renderer) renderer->rotateCamera(0.0f, rotateStep);
                    break;
                case GLFW_KEY_ESCAPE:
                    glfwSetWindowShouldClose(window, GLFW_TRUE);
                    break;
            }
        });
    }

    void cleanupVisualization() {
        if (!visualizationInitialized) return;

        // Release GL objects while the context still exists
        if (renderer) {
            renderer->cleanup();
            delete renderer;
            renderer = nullptr;
        }

        if (window) {
            glfwDestroyWindow(window);
            window = nullptr;
        }

        glfwTerminate();
        visualizationInitialized = false;
    }

    void printKeyboardControls() {
        std::cout << "\n╔═════════════════════════════════════════════════════╗" << std::endl;
        std::cout << "║               KEYBOARD CONTROLS                     ║" << std::endl;
        std::cout << "╠═════════════════════════════════════════════════════╣" << std::endl;
        std::cout << "║  Space       - Play/pause                           ║" << std::endl;
        std::cout << "║  Left/Right  - Step one frame (while paused)        ║" << std::endl;
        std::cout << "║  W/A/S/D     - Rotate camera                        ║" << std::endl;
        std::cout << "║  Left Click  - Pan camera                           ║" << std::endl;
        std::cout << "║  Right Click - Rotate camera                        ║" << std::endl;
        std::cout << "║  Scroll      - Zoom in/out                          ║" << std::endl;
        std::cout << "║  R           - Reset camera view                    ║" << std::endl;
        std::cout << "║  O/P         - Decrease/Increase point size         ║" << std::endl;
        std::cout << "║  C           - Toggle per-particle colors           ║" << std::endl;
        std::cout << "║  X           - Toggle box wireframe                 ║" << std::endl;
        std::cout << "║  ESC         - Exit viewer                          ║" << std::endl;
        std::cout << "╚═════════════════════════════════════════════════════╝" << std::endl;
        std::cout << std::endl;
    }

    void updateWindowTitle(long frame, long frames, double fps) {
        std::string title = "LJ Box Viewer - frame " +
                          std::to_string(frame + 1) + "/" + std::to_string(frames) +
                          (paused ? " (paused)" : "") + " - " +
                          std::to_string(int(fps)) + " FPS";
        glfwSetWindowTitle(window, title.c_str());
    }
}
