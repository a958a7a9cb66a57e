// SPDX-License-Identifier: MIT

#pragma once

#include <framework/shader.h>

#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <glm/mat4x4.hpp>
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>
DISABLE_WARNINGS_POP()

#include <filesystem>
#include <string>
#include <unordered_map>

// Named shader programs of one stage. Every program is built with the same
// preamble, so the volumetric stages share one declaration of the light
// parameter block and the scattering helpers.
class ShaderManager {
public:
    ShaderManager() = default;

    void appendPreambleFile(const std::filesystem::path& path);
    void addDefine(const std::string& name, const std::string& value);

    void load(const std::string& name, const std::filesystem::path& vertexPath, const std::filesystem::path& fragmentPath);
    // Throws when no program of that name was loaded.
    void bind(const std::string& name);

    void setVec2(const std::string& name, const glm::vec2& value) const;
    void setVec3(const std::string& name, const glm::vec3& value) const;
    void setFloat(const std::string& name, float value) const;
    void setInt(const std::string& name, int value) const;
    void setMat4(const std::string& name, const glm::mat4& value) const;

private:
    [[nodiscard]] Shader& requireCurrent() const;

private:
    std::string m_preamble;
    std::unordered_map<std::string, Shader> m_shaders;
    mutable Shader* m_currentShader { nullptr };
};
