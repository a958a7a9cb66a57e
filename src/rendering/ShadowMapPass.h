// SPDX-License-Identifier: MIT
#pragma once

#include "rendering/ShaderManager.h"
#include "volumetric/LightFrustum.h"
#include "volumetric/ShadowMap.h"

#include <framework/opengl_includes.h>

#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <glm/mat4x4.hpp>
DISABLE_WARNINGS_POP()

#include <filesystem>
#include <functional>

// Depth-only render of the scene from the directional light. Texels hold
// light clip depth (0 at the light, 1 where nothing was hit) and are read
// both as a shadow lookup and as the height field of the cap mesh.
class ShadowMapPass {
public:
    struct Settings {
        // glPolygonOffset factor and units.
        float slopeBias { 1.5f };
        float constantBias { 4.0f };
    };

    // Draws the casters. The shadow program is bound with lightMatrix set.
    using RenderGeometryCallback = std::function<void(const glm::mat4& lightMatrix)>;

    ShadowMapPass() = default;
    ~ShadowMapPass();

    ShadowMapPass(const ShadowMapPass&) = delete;
    ShadowMapPass& operator=(const ShadowMapPass&) = delete;

    void initialize(const std::filesystem::path& shaderDirectory, int resolution);
    void shutdown();

    // Reallocates the depth texture when the resolution changes.
    void resize(int resolution);

    void render(const LightFrustum& frustum, const RenderGeometryCallback& renderGeometry);
    void bindForSampling(GLuint unit) const;

    void drawImGuiPanel();

    [[nodiscard]] Settings& settings() { return m_settings; }
    [[nodiscard]] const Settings& settings() const { return m_settings; }
    [[nodiscard]] GLuint depthTexture() const { return m_depthTexture; }
    [[nodiscard]] int resolution() const { return m_resolution; }
    [[nodiscard]] const LightFrustum& frustum() const { return m_frustum; }

private:
    void ensureFramebuffer();
    void ensureSampler();

    Settings m_settings;
    ShaderManager m_shaders;
    LightFrustum m_frustum;

    GLuint m_framebuffer { 0 };
    GLuint m_depthTexture { 0 };
    GLuint m_sampler { 0 };
    int m_resolution { 0 };
};
