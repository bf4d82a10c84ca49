#pragma once

#include <GL/glew.h>
#include <GLFW/glfw3.h>

// Orbit camera around the box center: right button rotates, left button pans,
// scroll zooms.
class CameraController {
public:
    CameraController();

    // Initialize matrices
    void init(int windowWidth, int windowHeight);

    void updateMatrices();
    void resetView();

    // Mouse input handlers
    void handleMouseMove(double xpos, double ypos);
    void handleMouseButton(int button, int action);
    void handleScroll(double yoffset);

    float getTranslateX() const { return m_translateX; }
    float getTranslateY() const { return m_translateY; }
    float getCameraDistance() const { return m_distance; }

    void setTranslate(float x, float y);
    void setCameraDistance(float distance);

    // Adds to the current pitch/yaw, in radians
    void rotateBy(float deltaX, float deltaY);

    const float* getViewMatrix() const { return m_viewMatrix; }
    const float* getProjectionMatrix() const { return m_projMatrix; }

private:
    float m_rotX;           // pitch
    float m_rotY;           // yaw
    float m_distance;       // distance from the box center
    float m_translateX;
    float m_translateY;

    bool m_rotatePressed;
    bool m_panPressed;
    double m_lastMouseX;
    double m_lastMouseY;

    float m_viewMatrix[16];
    float m_projMatrix[16];

    void setupProjectionMatrix(float aspectRatio);
};
