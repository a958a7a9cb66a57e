// SPDX-License-Identifier: MIT

#include "volumetric/LightParameters.h"

#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <glm/matrix.hpp>
DISABLE_WARNINGS_POP()

namespace {

[[nodiscard]] LightParameters makeSharedParameters(const VolumetricSettings& settings, const CameraMatrices& camera, const LightFrustum& light)
{
    LightParameters parameters;
    parameters.sunlightDirection = light.direction();
    parameters.medium = settings.medium;
    parameters.shadowSize = settings.shadowSize;
    parameters.nearPlane = camera.nearPlane;
    parameters.inverseProjection = camera.inverseProjection();
    parameters.distanceModel = settings.distanceModel;
    parameters.shadowThresholdNarrowness = settings.shadowThresholdNarrowness;
    parameters.cameraSubmerged = settings.cameraSubmerged;
    return parameters;
}

} // namespace

LightParameters makeCapPassParameters(const VolumetricSettings& settings, const CameraMatrices& camera, const LightFrustum& light)
{
    LightParameters parameters = makeSharedParameters(settings, camera, light);
    parameters.transform = camera.viewProjection() * light.clipToWorld;
    return parameters;
}

LightParameters makeCompositionParameters(const VolumetricSettings& settings, const CameraMatrices& camera, const LightFrustum& light)
{
    LightParameters parameters = makeSharedParameters(settings, camera, light);
    parameters.transform = light.worldToClip * camera.inverseViewProjection();
    return parameters;
}

GpuLightParameters::GpuLightParameters(const LightParameters& parameters)
    : transform(parameters.transform)
    , inverseProjection(parameters.inverseProjection)
    , sunlightDirection(parameters.sunlightDirection, 0.0f)
    , medium(parameters.medium.transparency, parameters.medium.scatter)
    , params(parameters.nearPlane,
          parameters.shadowThresholdNarrowness,
          parameters.distanceModel == DistanceModel::ViewRay ? 1.0f : 0.0f,
          parameters.cameraSubmerged ? 1.0f : 0.0f)
    , sizes(parameters.shadowSize, 0, 0, 0)
{
}
