// SPDX-License-Identifier: MIT
#pragma once
#include "disable_all_warnings.h"
#include "opengl_includes.h"
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

struct ShaderLoadingException : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

class Shader {
public:
    Shader();
    Shader(const Shader&) = delete;
    Shader(Shader&&) noexcept;
    ~Shader();

    Shader& operator=(Shader&&) noexcept;

    void bind() const;

    // Returns -1 and logs a warning when the uniform was optimized away.
    [[nodiscard]] GLint getUniformLocation(const std::string& name) const;

    [[nodiscard]] bool valid() const;
    [[nodiscard]] GLuint id() const { return m_program; }

private:
    friend class ShaderBuilder;
    explicit Shader(GLuint program);

private:
    GLuint m_program;
};

// Compiles and links a program from GLSL files. Shader files cannot include
// one another; shared declarations go into the preamble, which is inserted
// after the #version and #extension lines of every stage.
class ShaderBuilder {
public:
    ShaderBuilder() = default;
    ShaderBuilder(const ShaderBuilder&) = delete;
    ShaderBuilder(ShaderBuilder&&) = default;
    ~ShaderBuilder();

    ShaderBuilder& setPreamble(std::string preamble);
    ShaderBuilder& addStage(GLuint shaderStage, const std::filesystem::path& shaderFile);
    Shader build();

private:
    void freeShaders();

private:
    std::string m_preamble;
    std::vector<GLuint> m_shaders;
};
