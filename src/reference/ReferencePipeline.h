// SPDX-License-Identifier: MIT
#pragma once

#include "reference/ImageBuffer.h"
#include "reference/SoftwareRasterizer.h"
#include "scene/SceneGeometry.h"
#include "volumetric/CameraTransforms.h"
#include "volumetric/LightFrustum.h"
#include "volumetric/ShadowMap.h"
#include "volumetric/StencilCapState.h"
#include "volumetric/VolumetricSettings.h"

#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <glm/vec3.hpp>
DISABLE_WARNINGS_POP()

struct ReferenceGBuffer {
    ImageBuffer<glm::vec3> diffuse;
    ImageBuffer<glm::vec3> normal;
    // View depth, 0 where nothing was drawn.
    ImageBuffer<float> linearDepth;
};

struct ReferenceFrame {
    // Reversed-Z window depth, cleared to 0.
    ImageBuffer<float> depth;
    ImageBuffer<StencilCapState> stencil;
    // Stencil as the capping passes left it, captured before composition clears it.
    ImageBuffer<StencilCapState> capStencil;
    ReferenceGBuffer gbuffer;
    ImageBuffer<glm::vec3> volumetric;
    ImageBuffer<float> shadowFactor;
    ImageBuffer<glm::vec3> color;
};

// CPU rendition of the GL frame: shadow map, G-buffer, both capping passes
// and composition, each a rasterization pass over the same core functions
// the shaders mirror. Used to check the technique without a GPU.
class ReferencePipeline {
public:
    struct Settings {
        // Constant light clip depth bias added to every shadow map write.
        float shadowDepthBias { 0.001f };
        glm::vec3 background { 0.0f };
    };

    ReferencePipeline(int width, int height, const VolumetricSettings& volumetric);
    ReferencePipeline(int width, int height, const VolumetricSettings& volumetric, const Settings& settings);

    void beginFrame();
    [[nodiscard]] ShadowMap renderShadowMap(const SceneGeometry& scene, const LightFrustum& light) const;
    void renderGeometry(const SceneGeometry& scene, const CameraMatrices& camera);
    void renderFarCap(const ShadowMap& shadowMap, const CameraMatrices& camera);
    void renderNearCap(const ShadowMap& shadowMap, const CameraMatrices& camera);
    void compose(const ShadowMap& shadowMap, const CameraMatrices& camera);

    // All passes in frame order. Returns the shadow map that was used.
    ShadowMap renderFrame(const SceneGeometry& scene, const CameraMatrices& camera, const LightFrustum& light);

    [[nodiscard]] const ReferenceFrame& frame() const { return m_frame; }
    [[nodiscard]] const VolumetricSettings& volumetricSettings() const { return m_volumetric; }
    [[nodiscard]] int width() const { return m_width; }
    [[nodiscard]] int height() const { return m_height; }

private:
    int m_width;
    int m_height;
    VolumetricSettings m_volumetric;
    Settings m_settings;
    ReferenceFrame m_frame;
};
