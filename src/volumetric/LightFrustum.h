// SPDX-License-Identifier: MIT
#pragma once

#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>
DISABLE_WARNINGS_POP()

// Sun-like light. The direction is the way the light travels, so a sun
// straight overhead is (0, -1, 0).
struct DirectionalLight {
    glm::vec3 direction { 0.35f, -1.0f, 0.25f };
    glm::vec3 focus { 0.0f };
    float halfExtent { 24.0f };
    float depthRange { 80.0f };
};

// Orthographic light frustum. Clip depth runs from 0 at the light to 1 at the
// far plane, so a shadow map cleared to 1 means "no occluder".
struct LightFrustum {
    glm::mat4 worldToClip { 1.0f };
    glm::mat4 clipToWorld { 1.0f };

    [[nodiscard]] glm::vec3 direction() const;
    [[nodiscard]] glm::vec3 toClip(const glm::vec3& worldPosition) const;
};

[[nodiscard]] LightFrustum buildLightFrustum(const DirectionalLight& light);
