#pragma once

#include <GL/glew.h>

// Compiles and links the particle and box shaders and sets their uniforms
class ShaderManager {
public:
    ShaderManager();
    ~ShaderManager();

    ShaderManager(const ShaderManager&) = delete;
    ShaderManager& operator=(const ShaderManager&) = delete;

    // Initialize and compile shaders
    bool init();

    GLuint getParticleShaderProgram() const { return m_particleShaderProgram; }
    GLuint getBoxShaderProgram() const { return m_boxShaderProgram; }

    // colorMode 0 uses 'color' for every particle, 1 uses the per-vertex color
    void setParticleUniforms(float pointSize, const float* color,
                             const float* viewMatrix, const float* projMatrix,
                             int colorMode);

    void setBoxUniforms(const float* viewMatrix, const float* projMatrix);

    // Round sprite with soft edges used for every particle
    GLuint createParticleTexture() const;

private:
    GLuint m_particleShaderProgram;
    GLuint m_boxShaderProgram;

    GLuint compileShader(GLenum type, const char* source);
    GLuint linkProgram(GLuint vertexShader, GLuint fragmentShader);
    GLuint buildProgram(const char* vertexSource, const char* fragmentSource);

    const char* getParticleVertexShader() const;
    const char* getParticleFragmentShader() const;
    const char* getBoxVertexShader() const;
    const char* getBoxFragmentShader() const;
};
