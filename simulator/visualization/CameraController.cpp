#include "CameraController.h"
#include <cmath>
#include <algorithm>

namespace {
    constexpr float DEFAULT_ROT_X = 0.35f;
    constexpr float DEFAULT_ROT_Y = 0.6f;
    constexpr float DEFAULT_DISTANCE = 4.0f;
    constexpr float MIN_DISTANCE = 0.5f;
    constexpr float MAX_DISTANCE = 50.0f;
    constexpr float PITCH_LIMIT = 1.5f;
}

CameraController::CameraController()
    : m_rotX(DEFAULT_ROT_X),
      m_rotY(DEFAULT_ROT_Y),
      m_distance(DEFAULT_DISTANCE),
      m_translateX(0.0f),
      m_translateY(0.0f),
      m_rotatePressed(false),
      m_panPressed(false),
      m_lastMouseX(0.0),
      m_lastMouseY(0.0)
{
    // Start from identity matrices until init() is called
    for (int i = 0; i < 16; i++) {
        m_viewMatrix[i] = (i % 5 == 0) ? 1.0f : 0.0f;
        m_projMatrix[i] = (i % 5 == 0) ? 1.0f : 0.0f;
    }
}

void CameraController::init(int windowWidth, int windowHeight) {
    float aspectRatio = (windowHeight > 0) ? (float)windowWidth / (float)windowHeight : 1.0f;
    setupProjectionMatrix(aspectRatio);
    updateMatrices();
}

void CameraController::setupProjectionMatrix(float aspectRatio) {
    // 45 degree vertical field of view
    float fovy = 45.0f;
    float nearZ = 0.1f;
    float farZ = 200.0f;
    float f = 1.0f / std::tan(fovy * 0.5f * 3.14159265f / 180.0f);

    for (int i = 0; i < 16; i++) {
        m_projMatrix[i] = 0.0f;
    }

    // Column-major perspective matrix
    m_projMatrix[0] = f / aspectRatio;
    m_projMatrix[5] = f;
    m_projMatrix[10] = (farZ + nearZ) / (nearZ - farZ);
    m_projMatrix[11] = -1.0f;
    m_projMatrix[14] = (2.0f * farZ * nearZ) / (nearZ - farZ);
}

void CameraController::updateMatrices() {
    // Rotation around X (pitch) and Y (yaw)
    float cosX = std::cos(m_rotX);
    float sinX = std::sin(m_rotX);
    float cosY = std::cos(m_rotY);
    float sinY = std::sin(m_rotY);

    float rotX[16] = {
        1,     0,     0, 0,
        0,  cosX, -sinX, 0,
        0,  sinX,  cosX, 0,
        0,     0,     0, 1
    };

    float rotY[16] = {
         cosY, 0, sinY, 0,
            0, 1,    0, 0,
        -sinY, 0, cosY, 0,
            0, 0,    0, 1
    };

    // view = rotY * rotX, then translate away from the scene
    for (int i = 0; i < 4; i++) {
        for (int j = 0; j < 4; j++) {
            float sum = 0.0f;
            for (int k = 0; k < 4; k++) {
                sum += rotY[i*4+k] * rotX[k*4+j];
            }
            m_viewMatrix[i*4+j] = sum;
        }
    }

    // Pan and step back along the view axis
    m_viewMatrix[12] = m_translateX;
    m_viewMatrix[13] = m_translateY;
    m_viewMatrix[14] = -m_distance;
}

void CameraController::resetView() {
    m_rotX = DEFAULT_ROT_X;
    m_rotY = DEFAULT_ROT_Y;
    m_distance = DEFAULT_DISTANCE;
    m_translateX = 0.0f;
    m_translateY = 0.0f;
    updateMatrices();
}

void CameraController::handleMouseMove(double xpos, double ypos) {
    float deltaX = static_cast<float>(xpos - m_lastMouseX);
    float deltaY = static_cast<float>(ypos - m_lastMouseY);

    if (m_rotatePressed) {
        rotateBy(deltaY * 0.01f, deltaX * 0.01f);
    }
    else if (m_panPressed) {
        // Pan faster when zoomed out
        float panSpeed = 0.002f * m_distance;
        m_translateX += deltaX * panSpeed;
        m_translateY -= deltaY * panSpeed;
        updateMatrices();
    }

    m_lastMouseX = xpos;
    m_lastMouseY = ypos;
}

void CameraController::handleMouseButton(int button, int action) {
    // Left button pans, right button rotates
    if (button == GLFW_MOUSE_BUTTON_LEFT) {
        m_panPressed = (action == GLFW_PRESS);
    }
    else if (button == GLFW_MOUSE_BUTTON_RIGHT) {
        m_rotatePressed = (action == GLFW_PRESS);
    }
}

void CameraController::handleScroll(double yoffset) {
    // Scroll up moves the camera closer
    float zoomFactor = 1.1f;
    setCameraDistance(m_distance * ((yoffset > 0) ? 1.0f / zoomFactor : zoomFactor));
}

void CameraController::setTranslate(float x, float y) {
    m_translateX = x;
    m_translateY = y;
    updateMatrices();
}

void CameraController::setCameraDistance(float distance) {
    m_distance = std::max(MIN_DISTANCE, std::min(distance, MAX_DISTANCE));
    updateMatrices();
}

void CameraController::rotateBy(float deltaX, float deltaY) {
    // Limit pitch to prevent flipping over the poles
    m_rotX = std::max(std::min(m_rotX + deltaX, PITCH_LIMIT), -PITCH_LIMIT);
    m_rotY += deltaY;
    updateMatrices();
}
