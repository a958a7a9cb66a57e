// SPDX-License-Identifier: MIT
#pragma once

#include "rendering/RenderStats.h"
#include "rendering/SceneMeshBuffer.h"
#include "rendering/ShaderManager.h"
#include "volumetric/CameraTransforms.h"

#include <framework/opengl_includes.h>

#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <glm/vec2.hpp>
DISABLE_WARNINGS_POP()

#include <filesystem>

// Opaque G-buffer pass. Owns the depth-stencil texture that the volumetric
// and composition stages attach to their own framebuffers.
class GeometryStage {
public:
    GeometryStage() = default;
    ~GeometryStage();

    GeometryStage(const GeometryStage&) = delete;
    GeometryStage& operator=(const GeometryStage&) = delete;

    void initialize(const std::filesystem::path& shaderDirectory, glm::ivec2 framebufferSize);
    void shutdown();
    void resize(glm::ivec2 framebufferSize);

    void render(const SceneMeshBuffer& mesh, const CameraMatrices& camera, RenderStats& stats);

    void drawImGuiPanel() const;

    [[nodiscard]] GLuint diffuseTexture() const { return m_diffuse; }
    [[nodiscard]] GLuint normalTexture() const { return m_normal; }
    [[nodiscard]] GLuint linearDepthTexture() const { return m_linearDepth; }
    [[nodiscard]] GLuint depthStencilTexture() const { return m_depthStencil; }
    [[nodiscard]] glm::ivec2 size() const { return m_size; }

private:
    void ensureFramebuffer(glm::ivec2 size);

    ShaderManager m_shaders;
    GLuint m_framebuffer { 0 };
    GLuint m_diffuse { 0 };
    GLuint m_normal { 0 };
    GLuint m_linearDepth { 0 };
    GLuint m_depthStencil { 0 };
    glm::ivec2 m_size { 0 };
};
