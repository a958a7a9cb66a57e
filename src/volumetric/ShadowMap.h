// SPDX-License-Identifier: MIT
#pragma once

#include "volumetric/LightFrustum.h"

#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <glm/vec2.hpp>
DISABLE_WARNINGS_POP()

#include <vector>

// Depth written where nothing occludes the light.
constexpr float kFarPlaneDepth = 1.0f;

// Supported shadow map sides. The upper bound is the usual GL_MAX_TEXTURE_SIZE
// and keeps the cap mesh vertex count within a GLsizei.
constexpr int kMinShadowSize = 2;
constexpr int kMaxShadowSize = 16384;

// CPU copy of one light's depth texture. Texel (0, 0) sits at light clip
// (-1, -1), matching a GL texture whose first row is the bottom one.
class ShadowMap {
public:
    ShadowMap(int size, const LightFrustum& frustum);

    [[nodiscard]] int size() const { return m_size; }
    [[nodiscard]] const LightFrustum& frustum() const { return m_frustum; }

    [[nodiscard]] float depth(int x, int y) const;
    void setDepth(int x, int y, float depth);
    void fill(float depth);

    // Bilinear lookup with clamp-to-edge addressing, as the lighting pass
    // sampler is configured.
    [[nodiscard]] float sampleLinear(const glm::vec2& uv) const;

private:
    [[nodiscard]] float clampedDepth(int x, int y) const;

    int m_size;
    LightFrustum m_frustum;
    std::vector<float> m_depths;
};
