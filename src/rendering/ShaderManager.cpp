// SPDX-License-Identifier: MIT

#include "rendering/ShaderManager.h"

#include <framework/opengl_includes.h>

#include <fmt/format.h>
#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <glm/gtc/type_ptr.hpp>
DISABLE_WARNINGS_POP()

#include <fstream>
#include <sstream>
#include <stdexcept>

void ShaderManager::appendPreambleFile(const std::filesystem::path& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file)
        throw ShaderLoadingException(fmt::format("Failed to open shader preamble {}", path.string()));

    std::stringstream buffer;
    buffer << file.rdbuf();
    m_preamble += buffer.str();
    if (!m_preamble.empty() && m_preamble.back() != '\n')
        m_preamble.push_back('\n');
}

void ShaderManager::addDefine(const std::string& name, const std::string& value)
{
    m_preamble += fmt::format("#define {} {}\n", name, value);
}

void ShaderManager::load(const std::string& name, const std::filesystem::path& vertexPath, const std::filesystem::path& fragmentPath)
{
    ShaderBuilder builder;
    builder.setPreamble(m_preamble);
    builder.addStage(GL_VERTEX_SHADER, vertexPath);
    builder.addStage(GL_FRAGMENT_SHADER, fragmentPath);

    // Rebuilding the bound program would leave a dangling pointer behind.
    auto it = m_shaders.find(name);
    if (it != m_shaders.end() && m_currentShader == &it->second)
        m_currentShader = nullptr;
    m_shaders[name] = builder.build();
}

void ShaderManager::bind(const std::string& name)
{
    auto it = m_shaders.find(name);
    if (it == m_shaders.end())
        throw std::runtime_error(fmt::format("Shader program '{}' was never loaded", name));

    m_currentShader = &it->second;
    m_currentShader->bind();
}

void ShaderManager::setVec2(const std::string& name, const glm::vec2& value) const
{
    Shader& shader = requireCurrent();
    const GLint location = shader.getUniformLocation(name);
    glUniform2fv(location, 1, glm::value_ptr(value));
}

void ShaderManager::setVec3(const std::string& name, const glm::vec3& value) const
{
    Shader& shader = requireCurrent();
    const GLint location = shader.getUniformLocation(name);
    glUniform3fv(location, 1, glm::value_ptr(value));
}

void ShaderManager::setFloat(const std::string& name, float value) const
{
    Shader& shader = requireCurrent();
    const GLint location = shader.getUniformLocation(name);
    glUniform1f(location, value);
}

void ShaderManager::setInt(const std::string& name, int value) const
{
    Shader& shader = requireCurrent();
    const GLint location = shader.getUniformLocation(name);
    glUniform1i(location, value);
}

void ShaderManager::setMat4(const std::string& name, const glm::mat4& value) const
{
    Shader& shader = requireCurrent();
    const GLint location = shader.getUniformLocation(name);
    glUniformMatrix4fv(location, 1, GL_FALSE, glm::value_ptr(value));
}

Shader& ShaderManager::requireCurrent() const
{
    if (!m_currentShader)
        throw std::runtime_error("No shader is currently bound in ShaderManager.");
    return *m_currentShader;
}
