// SPDX-License-Identifier: MIT

#include "volumetric/VolumeCapMesh.h"

#include <fmt/format.h>

#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <glm/common.hpp>
#include <glm/matrix.hpp>
DISABLE_WARNINGS_POP()

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace {

constexpr std::uint32_t kVerticesPerQuad = 6;
constexpr std::uint32_t kSkirtEdges = 4;

// The vertex count is drawn as a GLsizei and generated with int arithmetic.
static_assert(std::uint64_t(kMaxShadowSize + 1) * std::uint64_t(kMaxShadowSize + 1) * kVerticesPerQuad
            + std::uint64_t(kSkirtEdges) * kMaxShadowSize * kVerticesPerQuad
        <= std::uint64_t(std::numeric_limits<std::int32_t>::max()));

// Two counter-clockwise triangles per grid cell, (0,0)-(1,1) diagonal.
constexpr std::array<glm::ivec2, kVerticesPerQuad> kCellCorners { {
    { 0, 0 }, { 1, 0 }, { 1, 1 },
    { 0, 0 }, { 1, 1 }, { 0, 1 },
} };

// Skirt quad corners as (advancing track, held track) selectors. The
// advancing track walks along the edge, the held track picks the outer
// clip-space edge (0) or the rim of the top region (1).
constexpr std::array<glm::ivec2, kVerticesPerQuad> kSkirtCorners { {
    { 0, 0 }, { 1, 0 }, { 1, 1 },
    { 0, 0 }, { 1, 1 }, { 0, 1 },
} };

// Lattice position of step u along an edge: -1 is the clip-space corner,
// anything else the centre of texel u.
[[nodiscard]] int alongLattice(int step)
{
    return step < 0 ? 0 : 2 * step + 1;
}

// Quarter turn about the footprint centre; keeps the winding.
[[nodiscard]] glm::ivec2 rotateQuarter(const glm::ivec2& lattice, int shadowSize)
{
    return glm::ivec2(2 * shadowSize - lattice.y, lattice.x);
}

} // namespace

VolumeCapMesh::VolumeCapMesh(int shadowSize)
    : m_shadowSize(shadowSize)
{
    if (shadowSize < kMinShadowSize || shadowSize > kMaxShadowSize)
        throw std::invalid_argument(fmt::format(
            "Cap mesh needs a shadow size in [{}, {}], got {}", kMinShadowSize, kMaxShadowSize, shadowSize));
}

std::uint32_t VolumeCapMesh::topVertexCount() const
{
    const auto cells = static_cast<std::uint32_t>(m_shadowSize + 1);
    return cells * cells * kVerticesPerQuad;
}

std::uint32_t VolumeCapMesh::skirtVertexCount() const
{
    return kSkirtEdges * static_cast<std::uint32_t>(m_shadowSize) * kVerticesPerQuad;
}

std::uint32_t VolumeCapMesh::vertexCount() const
{
    return topVertexCount() + skirtVertexCount();
}

CapRegion VolumeCapMesh::region(std::uint32_t vertexIndex) const
{
    return vertexIndex < topVertexCount() ? CapRegion::Top : CapRegion::Skirt;
}

CapVertex VolumeCapMesh::vertex(std::uint32_t vertexIndex) const
{
    if (vertexIndex >= vertexCount())
        throw std::out_of_range(fmt::format("Cap vertex {} out of range ({} vertices)", vertexIndex, vertexCount()));

    if (region(vertexIndex) == CapRegion::Top)
        return topVertex(vertexIndex);
    return skirtVertex(vertexIndex - topVertexCount());
}

CapVertex VolumeCapMesh::topVertex(std::uint32_t vertexIndex) const
{
    const auto cellsPerRow = static_cast<std::uint32_t>(m_shadowSize + 1);
    const std::uint32_t cell = vertexIndex / kVerticesPerQuad;
    const glm::ivec2 corner = kCellCorners[vertexIndex % kVerticesPerQuad];

    // Cells start one texel before the map so the outer ring can fall to the far plane.
    const glm::ivec2 grid(
        static_cast<int>(cell % cellsPerRow) + corner.x - 1,
        static_cast<int>(cell / cellsPerRow) + corner.y - 1);
    const glm::ivec2 clamped = glm::clamp(grid, glm::ivec2(0), glm::ivec2(m_shadowSize - 1));

    CapVertex result;
    result.lattice = clamped * 2 + 1;
    if (clamped == grid)
        result.texel = clamped;
    return result;
}

CapVertex VolumeCapMesh::skirtVertex(std::uint32_t skirtIndex) const
{
    const auto quadsPerEdge = static_cast<std::uint32_t>(m_shadowSize);
    const std::uint32_t quad = skirtIndex / kVerticesPerQuad;
    const std::uint32_t edge = quad / quadsPerEdge;
    const int step = static_cast<int>(quad % quadsPerEdge);
    const glm::ivec2 selector = kSkirtCorners[skirtIndex % kVerticesPerQuad];

    // Bottom edge, walking +x; the other three are quarter turns of it.
    glm::ivec2 lattice(alongLattice(step - 1 + selector.x), selector.y);
    for (std::uint32_t turn = 0; turn < edge; ++turn)
        lattice = rotateQuarter(lattice, m_shadowSize);

    CapVertex result;
    result.lattice = lattice;
    return result;
}

glm::vec2 VolumeCapMesh::latticeToLightClip(const glm::ivec2& lattice) const
{
    const float size = static_cast<float>(m_shadowSize);
    return glm::vec2(static_cast<float>(lattice.x) / size - 1.0f, static_cast<float>(lattice.y) / size - 1.0f);
}

glm::vec4 VolumeCapMesh::lightClipPosition(std::uint32_t vertexIndex, const ShadowMap& shadowMap) const
{
    const CapVertex capVertex = vertex(vertexIndex);
    const float depth = capVertex.texel ? shadowMap.depth(capVertex.texel->x, capVertex.texel->y) : kFarPlaneDepth;
    return glm::vec4(latticeToLightClip(capVertex.lattice), depth, 1.0f);
}

glm::vec4 VolumeCapMesh::clipPosition(std::uint32_t vertexIndex, const ShadowMap& shadowMap, const glm::mat4& lightToScreen) const
{
    return lightToScreen * lightClipPosition(vertexIndex, shadowMap);
}

float VolumeCapMesh::surfaceDepth(const ShadowMap& shadowMap, const glm::vec2& lightClipXY) const
{
    const float size = static_cast<float>(m_shadowSize);
    const float last = size - 1.0f;
    const glm::vec2 texelCoord = (lightClipXY + 1.0f) * 0.5f * size - 0.5f;
    if (texelCoord.x < 0.0f || texelCoord.y < 0.0f || texelCoord.x > last || texelCoord.y > last)
        return kFarPlaneDepth;

    const int x0 = std::min(static_cast<int>(std::floor(texelCoord.x)), m_shadowSize - 2);
    const int y0 = std::min(static_cast<int>(std::floor(texelCoord.y)), m_shadowSize - 2);
    const float fx = texelCoord.x - static_cast<float>(x0);
    const float fy = texelCoord.y - static_cast<float>(y0);

    const float d00 = shadowMap.depth(x0, y0);
    const float d10 = shadowMap.depth(x0 + 1, y0);
    const float d01 = shadowMap.depth(x0, y0 + 1);
    const float d11 = shadowMap.depth(x0 + 1, y0 + 1);

    if (fx >= fy)
        return d00 + fx * (d10 - d00) + fy * (d11 - d10);
    return d00 + fy * (d01 - d00) + fx * (d11 - d01);
}

bool VolumeCapMesh::contains(const ShadowMap& shadowMap, const glm::vec3& lightClipPoint) const
{
    if (std::abs(lightClipPoint.x) > 1.0f || std::abs(lightClipPoint.y) > 1.0f)
        return false;
    if (lightClipPoint.z < 0.0f)
        return false;
    return lightClipPoint.z < surfaceDepth(shadowMap, glm::vec2(lightClipPoint));
}

bool capFrontFaceIsCounterClockwise(const glm::mat4& lightToScreen)
{
    return glm::determinant(lightToScreen) > 0.0f;
}
