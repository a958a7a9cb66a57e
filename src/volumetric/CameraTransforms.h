// SPDX-License-Identifier: MIT
#pragma once

#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <glm/mat4x4.hpp>
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>
DISABLE_WARNINGS_POP()

// Reversed-Z projection with the far plane at infinity: clip depth is the near
// plane distance, so ndc.z = nearPlane / viewDepth, 1 at the near plane and 0
// at infinity. Depth buffers are cleared to 0 and tested with GREATER.
[[nodiscard]] glm::mat4 reversedInfinitePerspective(float fovyRadians, float aspect, float nearPlane);

struct CameraMatrices {
    glm::mat4 view { 1.0f };
    glm::mat4 projection { 1.0f };
    float nearPlane { 0.1f };

    [[nodiscard]] glm::mat4 viewProjection() const { return projection * view; }
    [[nodiscard]] glm::mat4 inverseViewProjection() const;
    [[nodiscard]] glm::mat4 inverseProjection() const;
    [[nodiscard]] glm::vec3 position() const;
};

[[nodiscard]] CameraMatrices makeCameraMatrices(const glm::mat4& view, float fovyRadians, float aspect, float nearPlane);

// Pixel centre of a viewport in normalized device coordinates, with pixel row
// 0 at the bottom as in OpenGL.
[[nodiscard]] glm::vec2 pixelToNdc(int x, int y, int width, int height);
