// SPDX-License-Identifier: MIT

#include "volumetric/CameraTransforms.h"

#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <glm/mat4x4.hpp>
#include <glm/matrix.hpp>
#include <glm/trigonometric.hpp>
#include <glm/vec4.hpp>
DISABLE_WARNINGS_POP()

glm::mat4 reversedInfinitePerspective(float fovyRadians, float aspect, float nearPlane)
{
    const float focal = 1.0f / glm::tan(0.5f * fovyRadians);

    glm::mat4 result(0.0f);
    result[0][0] = focal / aspect;
    result[1][1] = focal;
    result[2][3] = -1.0f;
    result[3][2] = nearPlane;
    return result;
}

glm::mat4 CameraMatrices::inverseViewProjection() const
{
    return glm::inverse(viewProjection());
}

glm::mat4 CameraMatrices::inverseProjection() const
{
    return glm::inverse(projection);
}

glm::vec3 CameraMatrices::position() const
{
    return glm::vec3(glm::inverse(view)[3]);
}

CameraMatrices makeCameraMatrices(const glm::mat4& view, float fovyRadians, float aspect, float nearPlane)
{
    CameraMatrices camera;
    camera.view = view;
    camera.projection = reversedInfinitePerspective(fovyRadians, aspect, nearPlane);
    camera.nearPlane = nearPlane;
    return camera;
}

glm::vec2 pixelToNdc(int x, int y, int width, int height)
{
    return glm::vec2(
        (static_cast<float>(x) + 0.5f) / static_cast<float>(width) * 2.0f - 1.0f,
        (static_cast<float>(y) + 0.5f) / static_cast<float>(height) * 2.0f - 1.0f);
}
