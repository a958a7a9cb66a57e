// SPDX-License-Identifier: MIT
#pragma once

#include "rendering/LightParameterBuffer.h"
#include "rendering/RenderStats.h"
#include "rendering/ShaderManager.h"
#include "rendering/ShadowMapPass.h"
#include "volumetric/CameraTransforms.h"
#include "volumetric/StencilCapState.h"
#include "volumetric/VolumetricSettings.h"

#include <framework/opengl_includes.h>

#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <glm/vec2.hpp>
DISABLE_WARNINGS_POP()

#include <filesystem>

// Accumulates the in-scattered light of one directional light into an
// RGBA16F target. Pass A rasterizes the cap mesh against the scene depth,
// pass B covers the near plane where the camera itself sits in the lit
// volume. Both write the stencil bits the composition reads afterwards.
class VolumetricLightStage {
public:
    struct Settings {
        bool enabled { true };
        bool farCapEnabled { true };
        bool nearCapEnabled { true };
    };

    VolumetricLightStage() = default;
    ~VolumetricLightStage();

    VolumetricLightStage(const VolumetricLightStage&) = delete;
    VolumetricLightStage& operator=(const VolumetricLightStage&) = delete;

    void initialize(const std::filesystem::path& shaderDirectory, glm::ivec2 framebufferSize, GLuint depthStencilTexture);
    void shutdown();
    void resize(glm::ivec2 framebufferSize, GLuint depthStencilTexture);

    void render(const ShadowMapPass& shadowMap, const VolumetricSettings& volumetric, const CameraMatrices& camera, RenderStats& stats);

    void drawImGuiPanel();

    [[nodiscard]] Settings& settings() { return m_settings; }
    [[nodiscard]] GLuint scatterTexture() const { return m_scatter; }

private:
    void ensureFramebuffer(glm::ivec2 size, GLuint depthStencilTexture);
    void applyStencilPass(const StencilCapPass& pass) const;

    Settings m_settings;
    ShaderManager m_shaders;
    LightParameterBuffer m_parameters;

    GLuint m_framebuffer { 0 };
    GLuint m_scatter { 0 };
    GLuint m_emptyVao { 0 };
    GLuint m_attachedDepthStencil { 0 };
    glm::ivec2 m_size { 0 };
    std::uint64_t m_lastCapTriangles { 0 };
};
