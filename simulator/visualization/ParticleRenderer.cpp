#include "ParticleRenderer.h"
#include <iostream>
#include <cmath>
#include <vector>

namespace {
    // HSV with full saturation and value to RGB
    void hueToRgb(float hue, float* rgb) {
        float h = hue * 6.0f;
        int sector = static_cast<int>(std::floor(h)) % 6;
        float f = h - std::floor(h);
        float q = 1.0f - f;

        switch (sector) {
            case 0: rgb[0] = 1.0f; rgb[1] = f;    rgb[2] = 0.0f; break;
            case 1: rgb[0] = q;    rgb[1] = 1.0f; rgb[2] = 0.0f; break;
            case 2: rgb[0] = 0.0f; rgb[1] = 1.0f; rgb[2] = f;    break;
            case 3: rgb[0] = 0.0f; rgb[1] = q;    rgb[2] = 1.0f; break;
            case 4: rgb[0] = f;    rgb[1] = 0.0f; rgb[2] = 1.0f; break;
            default: rgb[0] = 1.0f; rgb[1] = 0.0f; rgb[2] = q;   break;
        }
    }
}

ParticleRenderer::ParticleRenderer()
    : m_vao(0),
      m_positionVBO(0),
      m_colorVBO(0),
      m_boxVAO(0),
      m_boxVBO(0),
      m_texture(0),
      m_numParticles(0),
      m_boxSize(1.0f),
      m_pointSize(30.0f),  // Default point size
      m_colorMode(ColorMode::PARTICLE_INDEX),
      m_showBox(true)
{
    // Pale blue used when every particle shares one color
    m_color[0] = 0.9f;
    m_color[1] = 0.9f;
    m_color[2] = 1.0f;
    m_color[3] = 0.9f;
}

ParticleRenderer::~ParticleRenderer() {
    cleanup();
}

void ParticleRenderer::cleanup() {
    if (m_texture) {
        glDeleteTextures(1, &m_texture);
        m_texture = 0;
    }

    if (m_positionVBO) {
        glDeleteBuffers(1, &m_positionVBO);
        m_positionVBO = 0;
    }

    if (m_colorVBO) {
        glDeleteBuffers(1, &m_colorVBO);
        m_colorVBO = 0;
    }

    if (m_boxVBO) {
        glDeleteBuffers(1, &m_boxVBO);
        m_boxVBO = 0;
    }

    if (m_vao) {
        glDeleteVertexArrays(1, &m_vao);
        m_vao = 0;
    }

    if (m_boxVAO) {
        glDeleteVertexArrays(1, &m_boxVAO);
        m_boxVAO = 0;
    }
}

bool ParticleRenderer::init(int particleCount, float boxSize) {
    m_numParticles = particleCount;
    m_boxSize = boxSize;

    // Initialize shaders
    if (!m_shaderManager.init()) {
        std::cerr << "Failed to initialize shader manager" << std::endl;
        return false;
    }

    // Create VAO and VBOs
    glGenVertexArrays(1, &m_vao);
    glGenBuffers(1, &m_positionVBO);
    glGenBuffers(1, &m_colorVBO);

    glBindVertexArray(m_vao);

    // Position VBO
    glBindBuffer(GL_ARRAY_BUFFER, m_positionVBO);
    glBufferData(GL_ARRAY_BUFFER, particleCount * sizeof(float) * 3, NULL, GL_DYNAMIC_DRAW);
    glVertexAttribPointer(0, 3, GL_FLOAT, GL_FALSE, sizeof(float) * 3, (void*)0);
    glEnableVertexAttribArray(0);

    // Color VBO, fixed for the whole playback
    glBindBuffer(GL_ARRAY_BUFFER, m_colorVBO);
    glBufferData(GL_ARRAY_BUFFER, particleCount * sizeof(float) * 4, NULL, GL_STATIC_DRAW);
    glVertexAttribPointer(1, 4, GL_FLOAT, GL_FALSE, sizeof(float) * 4, (void*)0);
    glEnableVertexAttribArray(1);

    glBindVertexArray(0);
    setupParticleColors();

    // Create particle texture
    m_texture = m_shaderManager.createParticleTexture();

    // Set up OpenGL state for point sprites
    glEnable(GL_PROGRAM_POINT_SIZE);
    glEnable(GL_BLEND);
    glEnable(GL_DEPTH_TEST);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

    // Initialize camera with window size
    int width, height;
    GLFWwindow* window = glfwGetCurrentContext();
    glfwGetFramebufferSize(window, &width, &height);
    m_camera.init(width, height);

    setupBoxBuffers();

    return true;
}

void ParticleRenderer::setupParticleColors() {
    std::vector<float> colors(m_numParticles * 4);

    // Spread hues evenly so every particle keeps its own color across frames
    for (int i = 0; i < m_numParticles; i++) {
        float hue = (m_numParticles > 1) ? (float)i / (float)m_numParticles : 0.0f;
        hueToRgb(hue, &colors[i * 4]);
        colors[i * 4 + 3] = 1.0f;
    }

    glBindBuffer(GL_ARRAY_BUFFER, m_colorVBO);
    glBufferSubData(GL_ARRAY_BUFFER, 0, colors.size() * sizeof(float), colors.data());
    glBindBuffer(GL_ARRAY_BUFFER, 0);
}

void ParticleRenderer::setupBoxBuffers() {
    const float c[3] = {0.45f, 0.45f, 0.55f};
    const float corners[8][3] = {
        {-1, -1, -1}, { 1, -1, -1}, { 1,  1, -1}, {-1,  1, -1},
        {-1, -1,  1}, { 1, -1,  1}, { 1,  1,  1}, {-1,  1,  1}
    };
    // Twelve edges as pairs of corner indices
    const int edges[12][2] = {
        {0, 1}, {1, 2}, {2, 3}, {3, 0},
        {4, 5}, {5, 6}, {6, 7}, {7, 4},
        {0, 4}, {1, 5}, {2, 6}, {3, 7}
    };

    // Position and color for both ends of each edge
    std::vector<float> vertices;
    vertices.reserve(12 * 2 * 6);
    for (const auto& edge : edges) {
        for (int end = 0; end < 2; end++) {
            const float* p = corners[edge[end]];
            vertices.insert(vertices.end(), {p[0], p[1], p[2], c[0], c[1], c[2]});
        }
    }

    // Create VBO and VAO for the box
    glGenVertexArrays(1, &m_boxVAO);
    glGenBuffers(1, &m_boxVBO);

    glBindVertexArray(m_boxVAO);
    glBindBuffer(GL_ARRAY_BUFFER, m_boxVBO);
    glBufferData(GL_ARRAY_BUFFER, vertices.size() * sizeof(float), vertices.data(), GL_STATIC_DRAW);

    // Position attribute
    glVertexAttribPointer(0, 3, GL_FLOAT, GL_FALSE, 6 * sizeof(float), (void*)0);
    glEnableVertexAttribArray(0);

    // Color attribute
    glVertexAttribPointer(1, 3, GL_FLOAT, GL_FALSE, 6 * sizeof(float), (void*)(3 * sizeof(float)));
    glEnableVertexAttribArray(1);

    glBindVertexArray(0);
}

void ParticleRenderer::updatePositions(const double* framePositions, int numParticles) {
    if (!m_positionVBO) return;

    // Never write past the buffer sized in init()
    int count = (numParticles < m_numParticles) ? numParticles : m_numParticles;
    float halfBox = 0.5f * m_boxSize;

    // Center the box on the origin and scale it to the unit cube
    std::vector<float> transformed(count * 3);
    for (int i = 0; i < count * 3; i++) {
        transformed[i] = static_cast<float>((framePositions[i] - halfBox) / halfBox);
    }

    // Update position VBO
    glBindBuffer(GL_ARRAY_BUFFER, m_positionVBO);
    glBufferSubData(GL_ARRAY_BUFFER, 0, transformed.size() * sizeof(float), transformed.data());
    glBindBuffer(GL_ARRAY_BUFFER, 0);
}

void ParticleRenderer::renderBox() {
    if (!m_showBox) return;

    // Set uniforms and draw the box edges
    m_shaderManager.setBoxUniforms(m_camera.getViewMatrix(), m_camera.getProjectionMatrix());

    glBindVertexArray(m_boxVAO);
    glDrawArrays(GL_LINES, 0, 24);
    glBindVertexArray(0);
}

void ParticleRenderer::render() {
    glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

    // Box wireframe
    renderBox();

    // Set uniform parameters
    m_shaderManager.setParticleUniforms(
        m_pointSize,
        m_color,
        m_camera.getViewMatrix(),
        m_camera.getProjectionMatrix(),
        static_cast<int>(m_colorMode)
    );

    // Bind texture
    glActiveTexture(GL_TEXTURE0);
    glBindTexture(GL_TEXTURE_2D, m_texture);

    // Set up proper blending for overlapping particles
    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

    // Allow equal depths so overlapping sprites do not flicker
    glEnable(GL_DEPTH_TEST);
    glDepthFunc(GL_LEQUAL);

    // Draw points
    glBindVertexArray(m_vao);
    glDrawArrays(GL_POINTS, 0, m_numParticles);
    glBindVertexArray(0);

    // Restore state
    glDepthFunc(GL_LESS);
    glUseProgram(0);
}
