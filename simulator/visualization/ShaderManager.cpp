#include "ShaderManager.h"
#include <iostream>
#include <cmath>
#include <algorithm>
#include <vector>

namespace {
    // Same as GLSL smoothstep
    float smoothstep(float edge0, float edge1, float x) {
        x = std::clamp((x - edge0) / (edge1 - edge0), 0.0f, 1.0f);
        return x * x * (3 - 2 * x);
    }
}

ShaderManager::ShaderManager()
    : m_particleShaderProgram(0),
      m_boxShaderProgram(0)
{
}

ShaderManager::~ShaderManager() {
    if (m_particleShaderProgram) {
        glDeleteProgram(m_particleShaderProgram);
        m_particleShaderProgram = 0;
    }

    if (m_boxShaderProgram) {
        glDeleteProgram(m_boxShaderProgram);
        m_boxShaderProgram = 0;
    }
}

bool ShaderManager::init() {
    // Particle point sprites
    m_particleShaderProgram = buildProgram(getParticleVertexShader(), getParticleFragmentShader());
    if (!m_particleShaderProgram) return false;

    // Box wireframe lines
    m_boxShaderProgram = buildProgram(getBoxVertexShader(), getBoxFragmentShader());
    return m_boxShaderProgram != 0;
}

GLuint ShaderManager::buildProgram(const char* vertexSource, const char* fragmentSource) {
    GLuint vertex = compileShader(GL_VERTEX_SHADER, vertexSource);
    if (!vertex) return 0;

    GLuint fragment = compileShader(GL_FRAGMENT_SHADER, fragmentSource);
    if (!fragment) {
        glDeleteShader(vertex);
        return 0;
    }

    GLuint program = linkProgram(vertex, fragment);
    glDeleteShader(vertex);
    glDeleteShader(fragment);
    return program;
}

GLuint ShaderManager::compileShader(GLenum type, const char* source) {
    GLuint shader = glCreateShader(type);
    glShaderSource(shader, 1, &source, NULL);
    glCompileShader(shader);

    // Check for compilation errors
    GLint success;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &success);
    if (!success) {
        char infoLog[512];
        glGetShaderInfoLog(shader, 512, NULL, infoLog);
        std::cerr << "Shader compilation failed: " << infoLog << std::endl;
        glDeleteShader(shader);
        return 0;
    }

    return shader;
}

GLuint ShaderManager::linkProgram(GLuint vertexShader, GLuint fragmentShader) {
    GLuint program = glCreateProgram();
    glAttachShader(program, vertexShader);
    glAttachShader(program, fragmentShader);
    glLinkProgram(program);

    // Check for linking errors
    GLint success;
    glGetProgramiv(program, GL_LINK_STATUS, &success);
    if (!success) {
        char infoLog[512];
        glGetProgramInfoLog(program, 512, NULL, infoLog);
        std::cerr << "Shader program linking failed: " << infoLog << std::endl;
        glDeleteProgram(program);
        return 0;
    }

    return program;
}

void ShaderManager::setParticleUniforms(float pointSize, const float* color,
                                        const float* viewMatrix, const float* projMatrix,
                                        int colorMode) {
    glUseProgram(m_particleShaderProgram);

    glUniform1f(glGetUniformLocation(m_particleShaderProgram, "pointSize"), pointSize);
    glUniform1i(glGetUniformLocation(m_particleShaderProgram, "particleTexture"), 0);
    glUniform4fv(glGetUniformLocation(m_particleShaderProgram, "particleColor"), 1, color);
    glUniformMatrix4fv(glGetUniformLocation(m_particleShaderProgram, "viewMatrix"), 1, GL_FALSE, viewMatrix);
    glUniformMatrix4fv(glGetUniformLocation(m_particleShaderProgram, "projMatrix"), 1, GL_FALSE, projMatrix);
    glUniform1i(glGetUniformLocation(m_particleShaderProgram, "colorMode"), colorMode);
}

void ShaderManager::setBoxUniforms(const float* viewMatrix, const float* projMatrix) {
    glUseProgram(m_boxShaderProgram);
    glUniformMatrix4fv(glGetUniformLocation(m_boxShaderProgram, "viewMatrix"), 1, GL_FALSE, viewMatrix);
    glUniformMatrix4fv(glGetUniformLocation(m_boxShaderProgram, "projMatrix"), 1, GL_FALSE, projMatrix);
}

GLuint ShaderManager::createParticleTexture() const {
    const int texSize = 64;
    const float innerRadius = 0.6f;
    std::vector<unsigned char> texData(texSize * texSize * 4);

    // Opaque disc with a smooth falloff to transparent at the rim
    for (int y = 0; y < texSize; y++) {
        for (int x = 0; x < texSize; x++) {
            float nx = (x / (float)(texSize - 1)) * 2.0f - 1.0f;
            float ny = (y / (float)(texSize - 1)) * 2.0f - 1.0f;
            float dist = std::sqrt(nx * nx + ny * ny);

            float alpha = (dist <= innerRadius) ? 1.0f : smoothstep(1.0f, innerRadius, dist);

            // Slightly brighter core gives the sprite some depth
            unsigned char brightness = 255;
            if (dist < innerRadius) {
                brightness = static_cast<unsigned char>(255 * (1.0f - (dist / innerRadius) * 0.25f));
            }

            int idx = 4 * (y * texSize + x);
            texData[idx + 0] = brightness;
            texData[idx + 1] = brightness;
            texData[idx + 2] = brightness;
            texData[idx + 3] = static_cast<unsigned char>(alpha * 255.0f);
        }
    }

    // Upload with mipmaps so small sprites stay smooth
    GLuint texture;
    glGenTextures(1, &texture);
    glBindTexture(GL_TEXTURE_2D, texture);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, texSize, texSize, 0, GL_RGBA, GL_UNSIGNED_BYTE, texData.data());
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR_MIPMAP_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    glGenerateMipmap(GL_TEXTURE_2D);
    glBindTexture(GL_TEXTURE_2D, 0);
    return texture;
}

const char* ShaderManager::getParticleVertexShader() const {
    return
        "#version 330 core\n"
        "layout(location = 0) in vec3 position;\n"
        "layout(location = 1) in vec4 color;\n"
        "uniform float pointSize;\n"
        "uniform mat4 viewMatrix;\n"
        "uniform mat4 projMatrix;\n"
        "out vec4 vertexColor;\n"
        "void main() {\n"
        "    vec4 viewPos = viewMatrix * vec4(position, 1.0);\n"
        "    gl_Position = projMatrix * viewPos;\n"
        "    // Perspective size: nearer particles look bigger\n"
        "    float distanceToCamera = max(length(viewPos.xyz), 0.1);\n"
        "    gl_PointSize = clamp(pointSize * 4.0 / distanceToCamera, 2.0, pointSize);\n"
        "    vertexColor = color;\n"
        "}\n";
}

const char* ShaderManager::getParticleFragmentShader() const {
    return
        "#version 330 core\n"
        "in vec4 vertexColor;\n"
        "out vec4 FragColor;\n"
        "uniform sampler2D particleTexture;\n"
        "uniform vec4 particleColor;\n"
        "uniform int colorMode;\n"
        "void main() {\n"
        "    float dist = distance(gl_PointCoord, vec2(0.5, 0.5)) * 2.0;\n"
        "    if (dist > 1.0) {\n"
        "        discard;\n"
        "    }\n"
        "    vec4 texColor = texture(particleTexture, gl_PointCoord);\n"
        "    vec4 baseColor = (colorMode == 1) ? vertexColor : particleColor;\n"
        "    FragColor = vec4(baseColor.rgb * texColor.rgb, baseColor.a * texColor.a);\n"
        "}\n";
}

const char* ShaderManager::getBoxVertexShader() const {
    return
        "#version 330 core\n"
        "layout(location = 0) in vec3 position;\n"
        "layout(location = 1) in vec3 color;\n"
        "uniform mat4 viewMatrix;\n"
        "uniform mat4 projMatrix;\n"
        "out vec3 vertexColor;\n"
        "void main() {\n"
        "    gl_Position = projMatrix * viewMatrix * vec4(position, 1.0);\n"
        "    vertexColor = color;\n"
        "}\n";
}

const char* ShaderManager::getBoxFragmentShader() const {
    return
        "#version 330 core\n"
        "in vec3 vertexColor;\n"
        "out vec4 FragColor;\n"
        "void main() {\n"
        "    FragColor = vec4(vertexColor, 1.0);\n"
        "}\n";
}
