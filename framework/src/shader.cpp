// SPDX-License-Identifier: MIT
#include "framework/shader.h"
DISABLE_WARNINGS_PUSH()
#include <fmt/format.h>
DISABLE_WARNINGS_POP()
#include <cctype>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

static constexpr GLuint invalid = 0xFFFFFFFF;

static bool checkShaderErrors(GLuint shader);
static bool checkProgramErrors(GLuint program);
static std::string readFile(const std::filesystem::path& filePath);
static void ensureNoIncludeDirective(const std::filesystem::path& filePath, const std::string& source);
static std::string composeShaderSource(const std::filesystem::path& filePath, const std::string& source, const std::string& preamble);

Shader::Shader(GLuint program)
    : m_program(program)
{
}

Shader::Shader()
    : m_program(invalid)
{
}

Shader::Shader(Shader&& other) noexcept
    : m_program(std::exchange(other.m_program, invalid))
{
}

Shader::~Shader()
{
    if (m_program != invalid)
        glDeleteProgram(m_program);
}

Shader& Shader::operator=(Shader&& other) noexcept
{
    if (this == &other)
        return *this;

    if (m_program != invalid)
        glDeleteProgram(m_program);

    m_program = std::exchange(other.m_program, invalid);
    return *this;
}

bool Shader::valid() const
{
    return m_program != invalid;
}

void Shader::bind() const
{
    if (!valid())
        throw ShaderLoadingException("Attempted to bind a shader program that was never built");
    glUseProgram(m_program);
}

GLint Shader::getUniformLocation(const std::string& name) const
{
    const GLint loc = glGetUniformLocation(m_program, name.c_str());
    if (loc < 0)
        fmt::print(stderr, "[Shader] program {} has no active uniform '{}'\n", m_program, name);
    return loc;
}

ShaderBuilder::~ShaderBuilder()
{
    freeShaders();
}

ShaderBuilder& ShaderBuilder::setPreamble(std::string preamble)
{
    m_preamble = std::move(preamble);
    return *this;
}

ShaderBuilder& ShaderBuilder::addStage(GLuint shaderStage, const std::filesystem::path& shaderFile)
{
    if (!std::filesystem::exists(shaderFile)) {
        throw ShaderLoadingException(fmt::format("File {} does not exist", shaderFile.string()));
    }

    const std::string fileSource = readFile(shaderFile);
    ensureNoIncludeDirective(shaderFile, fileSource);
    const std::string shaderSource = composeShaderSource(shaderFile, fileSource, m_preamble);
    const GLuint shader = glCreateShader(shaderStage);
    const char* shaderSourcePtr = shaderSource.c_str();
    glShaderSource(shader, 1, &shaderSourcePtr, nullptr);
    glCompileShader(shader);
    if (!checkShaderErrors(shader)) {
        glDeleteShader(shader);
        throw ShaderLoadingException(fmt::format("Failed to compile shader {}", shaderFile.string()));
    }

    m_shaders.push_back(shader);
    return *this;
}

Shader ShaderBuilder::build()
{
    // Combine vertex and fragment shaders into a single shader program.
    GLuint program = glCreateProgram();
    for (GLuint shader : m_shaders)
        glAttachShader(program, shader);
    glLinkProgram(program);

    if (!checkProgramErrors(program)) {
        glDeleteProgram(program);
        throw ShaderLoadingException("Shader program failed to link");
    }

    freeShaders();
    return Shader(program);
}

void ShaderBuilder::freeShaders()
{
    for (GLuint shader : m_shaders)
        glDeleteShader(shader);
    m_shaders.clear();
}

static std::string readFile(const std::filesystem::path& filePath)
{
    std::ifstream file(filePath, std::ios::binary);
    if (!file)
        throw ShaderLoadingException(fmt::format("Failed to open shader file {}", filePath.string()));

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

// Stages are compiled as single files; an #include would only fail later
// inside the driver with a less helpful message.
static void ensureNoIncludeDirective(const std::filesystem::path& filePath, const std::string& source)
{
    std::istringstream input(source);
    std::string line;
    std::size_t lineNumber = 0;
    bool inBlockComment = false;

    while (std::getline(input, line)) {
        ++lineNumber;
        std::size_t pos = 0;
        if (inBlockComment) {
            const std::size_t end = line.find("*/");
            if (end == std::string::npos)
                continue;
            inBlockComment = false;
            pos = end + 2;
        }

        pos = line.find_first_not_of(" \t\r", pos);
        if (pos == std::string::npos)
            continue;
        if (line.compare(pos, 2, "/*") == 0 && line.find("*/", pos + 2) == std::string::npos) {
            inBlockComment = true;
            continue;
        }
        if (line[pos] != '#')
            continue;

        pos = line.find_first_not_of(" \t", pos + 1);
        if (pos == std::string::npos || line.compare(pos, 7, "include") != 0)
            continue;
        const std::size_t after = pos + 7;
        if (after < line.size() && (std::isalnum(static_cast<unsigned char>(line[after])) || line[after] == '_'))
            continue;

        throw ShaderLoadingException(fmt::format(
            "Shader file {} contains forbidden #include directive on line {}.",
            filePath.string(), lineNumber));
    }
}

static std::string composeShaderSource(const std::filesystem::path& filePath, const std::string& source, const std::string& preamble)
{
    std::istringstream input(source);
    std::ostringstream headerStream;
    std::ostringstream bodyStream;

    std::string line;
    std::size_t lineNumber = 0;
    bool seenVersion = false;
    bool inHeader = true;

    while (std::getline(input, line)) {
        ++lineNumber;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        std::string trimmed = line;
        const auto firstNonSpace = trimmed.find_first_not_of(" \t");
        if (firstNonSpace != std::string::npos)
            trimmed.erase(0, firstNonSpace);
        else
            trimmed.clear();

        if (inHeader) {
            if (trimmed.empty()) {
                headerStream << line << '\n';
                continue;
            }

            if (!seenVersion) {
                if (trimmed.rfind("#version", 0) == 0) {
                    seenVersion = true;
                    headerStream << line << '\n';
                    continue;
                }

                throw ShaderLoadingException(fmt::format(
                    "Shader {} must begin with #version directive (encountered '{}' on line {}).",
                    filePath.string(), trimmed, lineNumber));
            }

            if (trimmed.rfind("#extension", 0) == 0) {
                headerStream << line << '\n';
                continue;
            }

            inHeader = false;
        }

        bodyStream << line << '\n';
    }

    if (!seenVersion) {
        throw ShaderLoadingException(fmt::format(
            "Shader {} is missing a #version directive.", filePath.string()));
    }

    std::string result = headerStream.str();
    if (!preamble.empty()) {
        if (!result.empty() && result.back() != '\n')
            result.push_back('\n');
        result += preamble;
        if (!preamble.empty() && preamble.back() != '\n')
            result.push_back('\n');
    }

    result += bodyStream.str();
    return result;
}

static bool checkShaderErrors(GLuint shader)
{
    // Check if the shader compiled successfully.
    GLint compileSuccessful;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &compileSuccessful);

    // If it didn't, then read and print the compile log.
    if (!compileSuccessful) {
        GLint logLength;
        glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &logLength);

        std::string logBuffer;
        logBuffer.resize(static_cast<size_t>(logLength));
        glGetShaderInfoLog(shader, logLength, nullptr, logBuffer.data());

        fmt::print(stderr, "[Shader] compile log:\n{}\n", logBuffer);
        return false;
    }
    return true;
}

static bool checkProgramErrors(GLuint program)
{
    // Check if the program linked successfully
    GLint linkSuccessful;
    glGetProgramiv(program, GL_LINK_STATUS, &linkSuccessful);

    // If it didn't, then read and print the link log
    if (!linkSuccessful) {
        GLint logLength;
        glGetProgramiv(program, GL_INFO_LOG_LENGTH, &logLength);

        std::string logBuffer;
        logBuffer.resize(static_cast<size_t>(logLength));
        glGetProgramInfoLog(program, logLength, nullptr, logBuffer.data());

        fmt::print(stderr, "[Shader] link log:\n{}\n", logBuffer);
        return false;
    }
    return true;
}
