// SPDX-License-Identifier: MIT

#include "TestHelpers.h"

#include "volumetric/CameraTransforms.h"
#include "volumetric/LightFrustum.h"
#include "volumetric/LightParameters.h"

#include <gtest/gtest.h>

#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <glm/geometric.hpp>
#include <glm/vec4.hpp>
DISABLE_WARNINGS_POP()

#include <cmath>
#include <cstddef>

namespace {

glm::vec3 project(const glm::mat4& matrix, const glm::vec3& point)
{
    const glm::vec4 clip = matrix * glm::vec4(point, 1.0f);
    return glm::vec3(clip) / clip.w;
}

DirectionalLight slantedLight()
{
    DirectionalLight light;
    light.direction = glm::vec3(0.35f, -1.0f, 0.25f);
    light.focus = glm::vec3(2.0f, 0.0f, -3.0f);
    light.halfExtent = 30.0f;
    light.depthRange = 100.0f;
    return light;
}

} // namespace

TEST(CameraTransforms, ReversedDepthIsNearOverViewDepth)
{
    const glm::mat4 projection = reversedInfinitePerspective(glm::radians(60.0f), 1.5f, 0.1f);

    EXPECT_NEAR(project(projection, glm::vec3(0.0f, 0.0f, -0.1f)).z, 1.0f, 1e-6f);
    EXPECT_NEAR(project(projection, glm::vec3(0.0f, 0.0f, -10.0f)).z, 0.01f, 1e-7f);
    EXPECT_NEAR(project(projection, glm::vec3(3.0f, -2.0f, -50.0f)).z, 0.002f, 1e-7f);
    // Depth only ever approaches zero.
    EXPECT_GT(project(projection, glm::vec3(0.0f, 0.0f, -1.0e6f)).z, 0.0f);
}

TEST(CameraTransforms, ProjectionKeepsFieldOfViewAndAspect)
{
    const glm::mat4 projection = reversedInfinitePerspective(glm::radians(90.0f), 2.0f, 0.1f);
    // The top edge of a 90 degree frustum rises one unit per unit of depth.
    EXPECT_NEAR(project(projection, glm::vec3(0.0f, 5.0f, -5.0f)).y, 1.0f, 1e-6f);
    EXPECT_NEAR(project(projection, glm::vec3(10.0f, 0.0f, -5.0f)).x, 1.0f, 1e-6f);
}

TEST(CameraTransforms, CameraMatricesInvertAndLocateTheEye)
{
    const glm::vec3 eye(4.0f, 3.0f, 9.0f);
    const CameraMatrices camera = lookAtCamera(eye, glm::vec3(0.0f), glm::vec3(0.0f, 1.0f, 0.0f), 0.25f);
    EXPECT_FLOAT_EQ(camera.nearPlane, 0.25f);
    expectVec3Near(camera.position(), eye, 1e-4f);

    const glm::vec3 world(1.0f, 2.0f, -3.0f);
    const glm::vec3 ndc = project(camera.viewProjection(), world);
    expectVec3Near(project(camera.inverseViewProjection(), ndc), world, 1e-3f);
}

TEST(CameraTransforms, PixelCentresToNdc)
{
    const glm::vec2 first = pixelToNdc(0, 0, 4, 2);
    EXPECT_FLOAT_EQ(first.x, -0.75f);
    EXPECT_FLOAT_EQ(first.y, -0.5f);
    const glm::vec2 last = pixelToNdc(3, 1, 4, 2);
    EXPECT_FLOAT_EQ(last.x, 0.75f);
    EXPECT_FLOAT_EQ(last.y, 0.5f);
}

TEST(LightFrustum, FocusSitsInTheMiddleOfTheDepthRange)
{
    const DirectionalLight light = slantedLight();
    const LightFrustum frustum = buildLightFrustum(light);
    const glm::vec3 direction = glm::normalize(light.direction);

    expectVec3Near(frustum.toClip(light.focus), glm::vec3(0.0f, 0.0f, 0.5f), 1e-5f);
    EXPECT_NEAR(frustum.toClip(light.focus - direction * 50.0f).z, 0.0f, 1e-5f);
    EXPECT_NEAR(frustum.toClip(light.focus + direction * 50.0f).z, 1.0f, 1e-5f);
}

TEST(LightFrustum, RecoversTheLightDirection)
{
    const DirectionalLight light = slantedLight();
    expectVec3Near(buildLightFrustum(light).direction(), glm::normalize(light.direction), 1e-5f);
}

TEST(LightFrustum, HalfExtentSpansTheClipSquare)
{
    DirectionalLight light;
    light.direction = glm::vec3(0.0f, -1.0f, 0.0f);
    light.halfExtent = 20.0f;
    light.depthRange = 60.0f;
    const LightFrustum frustum = buildLightFrustum(light);

    // A vertical light needs another up vector; the result must stay finite.
    const glm::vec3 corner = frustum.toClip(glm::vec3(20.0f, 0.0f, 20.0f));
    EXPECT_TRUE(std::isfinite(corner.x) && std::isfinite(corner.y));
    EXPECT_NEAR(std::abs(corner.x), 1.0f, 1e-5f);
    EXPECT_NEAR(std::abs(corner.y), 1.0f, 1e-5f);
    expectVec3Near(frustum.direction(), glm::vec3(0.0f, -1.0f, 0.0f), 1e-5f);
}

TEST(LightFrustum, DegenerateDirectionFallsBackToStraightDown)
{
    DirectionalLight light;
    light.direction = glm::vec3(0.0f);
    expectVec3Near(buildLightFrustum(light).direction(), glm::vec3(0.0f, -1.0f, 0.0f), 1e-5f);
}

TEST(LightParameters, CapAndCompositionTransformsAreInverse)
{
    VolumetricSettings settings;
    settings.shadowSize = 512;
    const CameraMatrices camera = lookAtCamera(glm::vec3(-10.0f, 4.0f, 12.0f), glm::vec3(0.0f, 2.0f, 0.0f), glm::vec3(0.0f, 1.0f, 0.0f));
    const LightFrustum light = buildLightFrustum(slantedLight());

    const LightParameters cap = makeCapPassParameters(settings, camera, light);
    const LightParameters composition = makeCompositionParameters(settings, camera, light);

    const glm::vec3 lightClip(0.3f, -0.4f, 0.6f);
    const glm::vec3 screen = project(cap.transform, lightClip);
    expectVec3Near(project(composition.transform, screen), lightClip, 1e-3f);

    // The cap transform agrees with going through world space by hand.
    const glm::vec3 world = project(light.clipToWorld, lightClip);
    expectVec3Near(screen, project(camera.viewProjection(), world), 1e-4f);

    EXPECT_EQ(cap.shadowSize, 512);
    expectVec3Near(cap.sunlightDirection, light.direction(), 1e-6f);
    EXPECT_FLOAT_EQ(composition.nearPlane, camera.nearPlane);
}

TEST(LightParameters, GpuLayoutMatchesStd140)
{
    EXPECT_EQ(offsetof(GpuLightParameters, transform), 0u);
    EXPECT_EQ(offsetof(GpuLightParameters, inverseProjection), 64u);
    EXPECT_EQ(offsetof(GpuLightParameters, sunlightDirection), 128u);
    EXPECT_EQ(offsetof(GpuLightParameters, medium), 144u);
    EXPECT_EQ(offsetof(GpuLightParameters, params), 160u);
    EXPECT_EQ(offsetof(GpuLightParameters, sizes), 176u);
    EXPECT_EQ(sizeof(GpuLightParameters), 192u);
}

TEST(LightParameters, GpuPackingOfScalars)
{
    LightParameters parameters;
    parameters.medium.transparency = glm::vec3(0.9f, 0.8f, 0.7f);
    parameters.medium.scatter = 0.02f;
    parameters.nearPlane = 0.2f;
    parameters.shadowThresholdNarrowness = 128.0f;
    parameters.distanceModel = DistanceModel::ViewRay;
    parameters.cameraSubmerged = true;
    parameters.shadowSize = 2048;

    const GpuLightParameters gpu(parameters);
    EXPECT_EQ(gpu.medium, glm::vec4(0.9f, 0.8f, 0.7f, 0.02f));
    EXPECT_EQ(gpu.params, glm::vec4(0.2f, 128.0f, 1.0f, 1.0f));
    EXPECT_EQ(gpu.sizes.x, 2048);
    EXPECT_FLOAT_EQ(gpu.sunlightDirection.w, 0.0f);

    parameters.distanceModel = DistanceModel::ReciprocalDepth;
    parameters.cameraSubmerged = false;
    const GpuLightParameters defaults(parameters);
    EXPECT_FLOAT_EQ(defaults.params.z, 0.0f);
    EXPECT_FLOAT_EQ(defaults.params.w, 0.0f);
}
