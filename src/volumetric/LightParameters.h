// SPDX-License-Identifier: MIT
#pragma once

#include "volumetric/CameraTransforms.h"
#include "volumetric/LightFrustum.h"
#include "volumetric/VolumetricSettings.h"

#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>
#include <glm/vec4.hpp>
DISABLE_WARNINGS_POP()

// Parameters of one volumetric or composition draw. The transform maps light
// clip space to camera clip space for the cap passes, and the other way round
// for the composition pass.
struct LightParameters {
    glm::mat4 transform { 1.0f };
    glm::vec3 sunlightDirection { 0.0f, -1.0f, 0.0f };
    MediumParameters medium {};
    int shadowSize { 0 };

    float nearPlane { 0.1f };
    glm::mat4 inverseProjection { 1.0f };
    DistanceModel distanceModel { DistanceModel::ReciprocalDepth };
    float shadowThresholdNarrowness { 256.0f };
    bool cameraSubmerged { false };
};

[[nodiscard]] LightParameters makeCapPassParameters(const VolumetricSettings& settings, const CameraMatrices& camera, const LightFrustum& light);
[[nodiscard]] LightParameters makeCompositionParameters(const VolumetricSettings& settings, const CameraMatrices& camera, const LightFrustum& light);

// std140 layout of LightParameters, bound as a uniform block.
struct GpuLightParameters {
    GpuLightParameters(const LightParameters& parameters);

    alignas(16) glm::mat4 transform { 1.0f };
    alignas(16) glm::mat4 inverseProjection { 1.0f };
    alignas(16) glm::vec4 sunlightDirection { 0.0f };
    // xyz = transparency, w = scatter
    alignas(16) glm::vec4 medium { 0.0f };
    // x = near plane, y = shadow threshold narrowness, z = distance model, w = camera submerged
    alignas(16) glm::vec4 params { 0.0f };
    // x = shadow size
    alignas(16) glm::ivec4 sizes { 0 };
};
