// SPDX-License-Identifier: MIT

#include "volumetric/DirectLighting.h"

#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <glm/common.hpp>
#include <glm/geometric.hpp>
DISABLE_WARNINGS_POP()

float cosineFactor(const glm::vec3& sunlightDirection, const glm::vec3& normal)
{
    return glm::clamp(-glm::dot(sunlightDirection, normal), 0.0f, 1.0f);
}

float lightingFactor(float shadowFactor, float cosine)
{
    return kDirectWeight * shadowFactor * cosine + kAmbientFloor;
}

float softShadowFactor(float shadowDepth, float geometryDepth, float narrowness)
{
    return glm::clamp(1.0f - (geometryDepth - shadowDepth) * narrowness, 0.0f, 1.0f);
}

glm::vec3 encodeNormal(const glm::vec3& normal, bool frontFacing)
{
    const glm::vec3 facing = frontFacing ? normal : -normal;
    return facing * 0.5f + 0.5f;
}

glm::vec3 decodeNormal(const glm::vec3& encoded)
{
    return glm::normalize(encoded * 2.0f - 1.0f);
}
