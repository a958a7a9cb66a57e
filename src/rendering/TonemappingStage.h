// SPDX-License-Identifier: MIT
#pragma once

#include "rendering/ShaderManager.h"

#include <framework/opengl_includes.h>

#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <glm/vec2.hpp>
DISABLE_WARNINGS_POP()

#include <filesystem>

// Resolves the HDR composition into the default framebuffer.
class TonemappingStage {
public:
    struct Settings {
        bool tonemapEnabled { true }; // Reinhard
        float exposure { 0.0f };      // stops
        float gamma { 2.2f };
    };

    TonemappingStage() = default;
    ~TonemappingStage();

    TonemappingStage(const TonemappingStage&) = delete;
    TonemappingStage& operator=(const TonemappingStage&) = delete;

    void initialize(const std::filesystem::path& shaderDirectory);
    void shutdown();

    void render(GLuint hdrTexture, glm::ivec2 framebufferSize, GLuint targetFramebuffer = 0);

    void drawImGuiPanel();

    [[nodiscard]] Settings& settings() { return m_settings; }

private:
    Settings m_settings;
    ShaderManager m_shaders;
    GLuint m_emptyVao { 0 };
};
