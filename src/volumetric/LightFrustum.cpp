// SPDX-License-Identifier: MIT

#include "volumetric/LightFrustum.h"

#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <glm/geometric.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/vec4.hpp>
DISABLE_WARNINGS_POP()

#include <cmath>

namespace {

[[nodiscard]] glm::vec3 sanitizeDirection(const glm::vec3& dir)
{
    glm::vec3 result = dir;
    if (glm::length(result) < 1e-4f)
        result = glm::vec3(0.0f, -1.0f, 0.0f);
    return glm::normalize(result);
}

} // namespace

glm::vec3 LightFrustum::direction() const
{
    // Light travels towards increasing clip depth.
    return glm::normalize(glm::vec3(clipToWorld * glm::vec4(0.0f, 0.0f, 1.0f, 0.0f)));
}

glm::vec3 LightFrustum::toClip(const glm::vec3& worldPosition) const
{
    const glm::vec4 clip = worldToClip * glm::vec4(worldPosition, 1.0f);
    return glm::vec3(clip) / clip.w;
}

LightFrustum buildLightFrustum(const DirectionalLight& light)
{
    const glm::vec3 direction = sanitizeDirection(light.direction);
    const float halfRange = 0.5f * light.depthRange;
    const glm::vec3 eye = light.focus - direction * halfRange;
    const glm::vec3 up = std::abs(direction.y) > 0.99f ? glm::vec3(0.0f, 0.0f, -1.0f) : glm::vec3(0.0f, 1.0f, 0.0f);

    const glm::mat4 view = glm::lookAt(eye, light.focus, up);
    const glm::mat4 projection = glm::orthoRH_ZO(-light.halfExtent, light.halfExtent,
        -light.halfExtent, light.halfExtent, 0.0f, light.depthRange);

    LightFrustum frustum;
    frustum.worldToClip = projection * view;
    frustum.clipToWorld = glm::inverse(frustum.worldToClip);
    return frustum;
}
