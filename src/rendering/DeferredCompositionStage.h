// SPDX-License-Identifier: MIT
#pragma once

#include "rendering/GeometryStage.h"
#include "rendering/LightParameterBuffer.h"
#include "rendering/RenderStats.h"
#include "rendering/ShaderManager.h"
#include "rendering/ShadowMapPass.h"
#include "rendering/VolumetricLightStage.h"
#include "volumetric/CameraTransforms.h"
#include "volumetric/VolumetricSettings.h"

#include <framework/opengl_includes.h>

#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>
DISABLE_WARNINGS_POP()

#include <filesystem>

// Lights the G-buffer, adds the accumulated scattering and closes the lit
// segments that end on a surface. Leaves the stencil cleared for the next light.
class DeferredCompositionStage {
public:
    struct Settings {
        glm::vec3 background { 0.02f, 0.025f, 0.035f };
        bool closingTermEnabled { true };
    };

    DeferredCompositionStage() = default;
    ~DeferredCompositionStage();

    DeferredCompositionStage(const DeferredCompositionStage&) = delete;
    DeferredCompositionStage& operator=(const DeferredCompositionStage&) = delete;

    void initialize(const std::filesystem::path& shaderDirectory, glm::ivec2 framebufferSize, GLuint depthStencilTexture);
    void shutdown();
    void resize(glm::ivec2 framebufferSize, GLuint depthStencilTexture);

    void render(const GeometryStage& gbuffer,
        const VolumetricLightStage& volumetricLight,
        const ShadowMapPass& shadowMap,
        const VolumetricSettings& volumetric,
        const CameraMatrices& camera,
        RenderStats& stats);

    void drawImGuiPanel();

    [[nodiscard]] Settings& settings() { return m_settings; }
    [[nodiscard]] GLuint hdrTexture() const { return m_hdrColor; }

private:
    void ensureFramebuffer(glm::ivec2 size, GLuint depthStencilTexture);

    Settings m_settings;
    ShaderManager m_shaders;
    LightParameterBuffer m_parameters;

    GLuint m_framebuffer { 0 };
    GLuint m_hdrColor { 0 };
    GLuint m_emptyVao { 0 };
    GLuint m_attachedDepthStencil { 0 };
    glm::ivec2 m_size { 0 };
};
