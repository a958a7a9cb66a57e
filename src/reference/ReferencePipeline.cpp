// SPDX-License-Identifier: MIT

#include "reference/ReferencePipeline.h"

#include "volumetric/DirectLighting.h"
#include "volumetric/LightParameters.h"
#include "volumetric/ScatteringIntegrator.h"
#include "volumetric/VolumeCapMesh.h"

#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <glm/vec2.hpp>
#include <glm/vec4.hpp>
DISABLE_WARNINGS_POP()

#include <algorithm>
#include <array>
#include <cstdint>

namespace {

// Covers the viewport; z = w puts it on the near plane of a reversed-Z projection.
constexpr std::array<glm::vec4, 3> kNearPlaneTriangle { {
    { -1.0f, -1.0f, 1.0f, 1.0f },
    { 3.0f, -1.0f, 1.0f, 1.0f },
    { -1.0f, 3.0f, 1.0f, 1.0f },
} };

} // namespace

ReferencePipeline::ReferencePipeline(int width, int height, const VolumetricSettings& volumetric)
    : ReferencePipeline(width, height, volumetric, Settings {})
{
}

ReferencePipeline::ReferencePipeline(int width, int height, const VolumetricSettings& volumetric, const Settings& settings)
    : m_width(width)
    , m_height(height)
    , m_volumetric(volumetric)
    , m_settings(settings)
{
    beginFrame();
}

void ReferencePipeline::beginFrame()
{
    m_frame.depth = ImageBuffer<float>(m_width, m_height, 0.0f);
    m_frame.stencil = ImageBuffer<StencilCapState>(m_width, m_height);
    m_frame.capStencil = ImageBuffer<StencilCapState>(m_width, m_height);
    m_frame.gbuffer.diffuse = ImageBuffer<glm::vec3>(m_width, m_height, glm::vec3(0.0f));
    m_frame.gbuffer.normal = ImageBuffer<glm::vec3>(m_width, m_height, glm::vec3(0.5f));
    m_frame.gbuffer.linearDepth = ImageBuffer<float>(m_width, m_height, 0.0f);
    m_frame.volumetric = ImageBuffer<glm::vec3>(m_width, m_height, glm::vec3(0.0f));
    m_frame.shadowFactor = ImageBuffer<float>(m_width, m_height, 1.0f);
    m_frame.color = ImageBuffer<glm::vec3>(m_width, m_height, m_settings.background);
}

ShadowMap ReferencePipeline::renderShadowMap(const SceneGeometry& scene, const LightFrustum& light) const
{
    ShadowMap shadowMap(m_volumetric.shadowSize, light);
    SoftwareRasterizer rasterizer(shadowMap.size(), shadowMap.size());

    for (const SceneTriangle& triangle : scene.triangles()) {
        const std::array<glm::vec4, 3> clip {
            light.worldToClip * glm::vec4(triangle.positions[0], 1.0f),
            light.worldToClip * glm::vec4(triangle.positions[1], 1.0f),
            light.worldToClip * glm::vec4(triangle.positions[2], 1.0f),
        };
        rasterizer.drawTriangle(clip, [&](const RasterFragment& fragment) {
            const float biased = std::min(fragment.depth + m_settings.shadowDepthBias, kFarPlaneDepth);
            if (biased < shadowMap.depth(fragment.x, fragment.y))
                shadowMap.setDepth(fragment.x, fragment.y, biased);
        });
    }
    return shadowMap;
}

void ReferencePipeline::renderGeometry(const SceneGeometry& scene, const CameraMatrices& camera)
{
    SoftwareRasterizer rasterizer(m_width, m_height);
    const glm::mat4 viewProjection = camera.viewProjection();

    for (const SceneTriangle& triangle : scene.triangles()) {
        const std::array<glm::vec4, 3> clip {
            viewProjection * glm::vec4(triangle.positions[0], 1.0f),
            viewProjection * glm::vec4(triangle.positions[1], 1.0f),
            viewProjection * glm::vec4(triangle.positions[2], 1.0f),
        };
        rasterizer.drawTriangle(clip, [&](const RasterFragment& fragment) {
            float& depth = m_frame.depth.at(fragment.x, fragment.y);
            if (!(fragment.depth > depth))
                return;
            depth = fragment.depth;
            m_frame.gbuffer.diffuse.at(fragment.x, fragment.y) = triangle.diffuse;
            m_frame.gbuffer.normal.at(fragment.x, fragment.y) = encodeNormal(triangle.normal, fragment.frontFacing);
            m_frame.gbuffer.linearDepth.at(fragment.x, fragment.y) = camera.nearPlane / fragment.depth;
        });
    }
}

void ReferencePipeline::renderFarCap(const ShadowMap& shadowMap, const CameraMatrices& camera)
{
    const LightParameters parameters = makeCapPassParameters(m_volumetric, camera, shadowMap.frustum());
    const VolumeCapMesh mesh(shadowMap.size());
    const AnalyticScatteringIntegrator integrator(parameters.medium);
    const StencilCapPass pass = farCapPass();

    SoftwareRasterizer rasterizer(m_width, m_height);
    rasterizer.setFrontFaceCounterClockwise(capFrontFaceIsCounterClockwise(parameters.transform));

    const auto onFragment = [&](const RasterFragment& fragment) {
        if (!(fragment.depth > m_frame.depth.at(fragment.x, fragment.y)))
            return;

        const StencilFaceOps& ops = pass.face(fragment.frontFacing);
        m_frame.stencil.at(fragment.x, fragment.y).apply(ops.depthPass, ops.writeMask);

        const glm::vec2 ndc = pixelToNdc(fragment.x, fragment.y, m_width, m_height);
        const float distance = surfaceDistance(parameters.distanceModel, parameters.nearPlane,
            parameters.inverseProjection, ndc, fragment.depth);
        m_frame.volumetric.at(fragment.x, fragment.y) += integrator.signedContribution(distance, fragment.frontFacing);
    };

    for (std::uint32_t first = 0; first + 2 < mesh.vertexCount(); first += 3) {
        const std::array<glm::vec4, 3> clip {
            mesh.clipPosition(first, shadowMap, parameters.transform),
            mesh.clipPosition(first + 1, shadowMap, parameters.transform),
            mesh.clipPosition(first + 2, shadowMap, parameters.transform),
        };
        rasterizer.drawTriangle(clip, onFragment);
    }
}

void ReferencePipeline::renderNearCap(const ShadowMap& shadowMap, const CameraMatrices& camera)
{
    // Near plane fragments are taken back into light clip space.
    const LightParameters parameters = makeCompositionParameters(m_volumetric, camera, shadowMap.frustum());
    const VolumeCapMesh mesh(shadowMap.size());
    const AnalyticScatteringIntegrator integrator(parameters.medium);
    const StencilCapPass pass = nearCapPass();

    SoftwareRasterizer rasterizer(m_width, m_height);
    rasterizer.setFrontFaceCounterClockwise(true);

    rasterizer.drawTriangle(kNearPlaneTriangle, [&](const RasterFragment& fragment) {
        const glm::vec2 ndc = pixelToNdc(fragment.x, fragment.y, m_width, m_height);
        const glm::vec4 light = parameters.transform * glm::vec4(ndc, fragment.depth, 1.0f);
        if (!mesh.contains(shadowMap, glm::vec3(light) / light.w))
            return;

        const StencilFaceOps& ops = pass.face(fragment.frontFacing);
        m_frame.stencil.at(fragment.x, fragment.y).apply(ops.depthPass, ops.writeMask);

        const float distance = surfaceDistance(parameters.distanceModel, parameters.nearPlane,
            parameters.inverseProjection, ndc, fragment.depth);
        m_frame.volumetric.at(fragment.x, fragment.y) += integrator.signedContribution(distance, fragment.frontFacing);
    });
}

void ReferencePipeline::compose(const ShadowMap& shadowMap, const CameraMatrices& camera)
{
    const LightParameters parameters = makeCompositionParameters(m_volumetric, camera, shadowMap.frustum());
    const AnalyticScatteringIntegrator integrator(parameters.medium);
    m_frame.capStencil = m_frame.stencil;

    for (int y = 0; y < m_height; ++y) {
        for (int x = 0; x < m_width; ++x) {
            const glm::vec3& volumetric = m_frame.volumetric.at(x, y);
            const float linearDepth = m_frame.gbuffer.linearDepth.at(x, y);
            if (linearDepth <= 0.0f) {
                m_frame.color.at(x, y) = m_settings.background + volumetric;
                continue;
            }

            const glm::vec2 ndc = pixelToNdc(x, y, m_width, m_height);
            const float ndcDepth = parameters.nearPlane / linearDepth;
            const glm::vec4 lightClip = parameters.transform * glm::vec4(ndc, ndcDepth, 1.0f);
            const glm::vec3 light = glm::vec3(lightClip) / lightClip.w;

            const float shadowDepth = shadowMap.sampleLinear(glm::vec2(light) * 0.5f + 0.5f);
            const float shadow = softShadowFactor(shadowDepth, light.z, parameters.shadowThresholdNarrowness);
            const float cosine = cosineFactor(parameters.sunlightDirection, decodeNormal(m_frame.gbuffer.normal.at(x, y)));
            m_frame.shadowFactor.at(x, y) = shadow;

            const float distance = surfaceDistance(parameters.distanceModel, parameters.nearPlane,
                parameters.inverseProjection, ndc, ndcDepth);
            glm::vec3 color = m_frame.gbuffer.diffuse.at(x, y) * lightingFactor(shadow, cosine);
            if (parameters.cameraSubmerged)
                color *= integrator.absorption(distance);
            color += volumetric;

            // The lit volume ends on this surface: close the last open segment.
            // Far cap fragments behind the surface never contributed, so the
            // far inclusion bit needs no check here.
            if (m_frame.stencil.at(x, y).geometryInsideVolume())
                color -= integrator.contribution(distance);

            m_frame.color.at(x, y) = color;
        }
    }

    m_frame.stencil.fill(StencilCapState {});
}

ShadowMap ReferencePipeline::renderFrame(const SceneGeometry& scene, const CameraMatrices& camera, const LightFrustum& light)
{
    beginFrame();
    ShadowMap shadowMap = renderShadowMap(scene, light);
    renderGeometry(scene, camera);
    renderFarCap(shadowMap, camera);
    renderNearCap(shadowMap, camera);
    compose(shadowMap, camera);
    return shadowMap;
}
