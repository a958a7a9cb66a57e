// SPDX-License-Identifier: MIT

#include "volumetric/ShadowMap.h"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>

ShadowMap::ShadowMap(int size, const LightFrustum& frustum)
    : m_size(size)
    , m_frustum(frustum)
{
    if (size < kMinShadowSize || size > kMaxShadowSize)
        throw std::invalid_argument(fmt::format(
            "Shadow map size must lie in [{}, {}], got {}", kMinShadowSize, kMaxShadowSize, size));
    m_depths.assign(static_cast<std::size_t>(size) * static_cast<std::size_t>(size), kFarPlaneDepth);
}

float ShadowMap::depth(int x, int y) const
{
    return m_depths[static_cast<std::size_t>(y) * static_cast<std::size_t>(m_size) + static_cast<std::size_t>(x)];
}

void ShadowMap::setDepth(int x, int y, float depth)
{
    m_depths[static_cast<std::size_t>(y) * static_cast<std::size_t>(m_size) + static_cast<std::size_t>(x)] = depth;
}

void ShadowMap::fill(float depth)
{
    std::fill(m_depths.begin(), m_depths.end(), depth);
}

float ShadowMap::clampedDepth(int x, int y) const
{
    return depth(std::clamp(x, 0, m_size - 1), std::clamp(y, 0, m_size - 1));
}

float ShadowMap::sampleLinear(const glm::vec2& uv) const
{
    const float tx = uv.x * static_cast<float>(m_size) - 0.5f;
    const float ty = uv.y * static_cast<float>(m_size) - 0.5f;
    const float fx = std::floor(tx);
    const float fy = std::floor(ty);
    const int x0 = static_cast<int>(fx);
    const int y0 = static_cast<int>(fy);
    const float wx = tx - fx;
    const float wy = ty - fy;

    const float bottom = clampedDepth(x0, y0) * (1.0f - wx) + clampedDepth(x0 + 1, y0) * wx;
    const float top = clampedDepth(x0, y0 + 1) * (1.0f - wx) + clampedDepth(x0 + 1, y0 + 1) * wx;
    return bottom * (1.0f - wy) + top * wy;
}
