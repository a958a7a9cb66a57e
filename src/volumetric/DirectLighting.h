// SPDX-License-Identifier: MIT
#pragma once

#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <glm/vec3.hpp>
DISABLE_WARNINGS_POP()

// Fully shadowed surfaces keep this much of their diffuse colour.
constexpr float kAmbientFloor = 0.05f;
constexpr float kDirectWeight = 1.0f - kAmbientFloor;

[[nodiscard]] float cosineFactor(const glm::vec3& sunlightDirection, const glm::vec3& normal);
[[nodiscard]] float lightingFactor(float shadowFactor, float cosine);

// 1 where the geometry is at or in front of the stored occluder depth, falling
// to 0 over 1 / narrowness of light clip depth behind it.
[[nodiscard]] float softShadowFactor(float shadowDepth, float geometryDepth, float narrowness);

// G-buffer normals are stored in [0, 1] and point towards the side that was
// rasterized, so back faces are flipped before encoding.
[[nodiscard]] glm::vec3 encodeNormal(const glm::vec3& normal, bool frontFacing);
[[nodiscard]] glm::vec3 decodeNormal(const glm::vec3& encoded);
