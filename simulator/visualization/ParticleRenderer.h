#pragma once

#include <GL/glew.h>
#include <GLFW/glfw3.h>
#include "ShaderManager.h"
#include "CameraController.h"

class ParticleRenderer {
public:
    ParticleRenderer();
    ~ParticleRenderer();

    ParticleRenderer(const ParticleRenderer&) = delete;
    ParticleRenderer& operator=(const ParticleRenderer&) = delete;

    bool init(int particleCount, float boxSize);
    void cleanup();

    // Set and get rendering parameters
    void setPointSize(float size) { m_pointSize = size; }
    float getPointSize() const { return m_pointSize; }

    // Uploads one trajectory frame: numParticles * 3 doubles, x y z per particle.
    // Box coordinates [0, L] are mapped to [-1, 1] around the origin.
    void updatePositions(const double* framePositions, int numParticles);
    void render();

    // Camera delegate methods
    float getTranslateX() const { return m_camera.getTranslateX(); }
    float getTranslateY() const { return m_camera.getTranslateY(); }
    float getCameraDistance() const { return m_camera.getCameraDistance(); }

    void setTranslate(float x, float y) { m_camera.setTranslate(x, y); }
    void setCameraDistance(float distance) { m_camera.setCameraDistance(distance); }
    void rotateCamera(float deltaX, float deltaY) { m_camera.rotateBy(deltaX, deltaY); }

    void resetView() { m_camera.resetView(); }

    // Mouse input handlers (forwarded to camera)
    void handleMouseMove(double xpos, double ypos) { m_camera.handleMouseMove(xpos, ypos); }
    void handleMouseButton(int button, int action) { m_camera.handleMouseButton(button, action); }
    void handleMouseScroll(double yoffset) { m_camera.handleScroll(yoffset); }

    // Box wireframe rendering
    void toggleBox() { m_showBox = !m_showBox; }
    bool getShowBox() const { return m_showBox; }

    enum class ColorMode {
        UNIFORM,
        PARTICLE_INDEX
    };

    void setColorMode(ColorMode mode) { m_colorMode = mode; }
    ColorMode getColorMode() const { return m_colorMode; }

private:
    // OpenGL resources
    GLuint m_vao;
    GLuint m_positionVBO;
    GLuint m_colorVBO;
    GLuint m_boxVAO;
    GLuint m_boxVBO;
    GLuint m_texture;
    int m_numParticles;
    float m_boxSize;

    // Component managers
    ShaderManager m_shaderManager;
    CameraController m_camera;

    // Rendering parameters
    float m_pointSize;
    float m_color[4];
    ColorMode m_colorMode;
    bool m_showBox;

    void setupParticleColors();
    void setupBoxBuffers();
    void renderBox();
};
