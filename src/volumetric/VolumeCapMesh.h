// SPDX-License-Identifier: MIT
#pragma once

#include "volumetric/ShadowMap.h"

#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <glm/mat4x4.hpp>
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>
#include <glm/vec4.hpp>
DISABLE_WARNINGS_POP()

#include <cstdint>
#include <optional>

enum class CapRegion {
    Top,
    Skirt,
};

// A cap vertex before its depth is looked up. Lattice coordinates count half
// texels: 0 and 2S are the clip-space edges and 2k+1 is the centre of texel k.
struct CapVertex {
    glm::ivec2 lattice { 0 };
    // Texel that supplies the depth, empty when the vertex sits on the far plane.
    std::optional<glm::ivec2> texel;
};

// Index-free surface bounding the lit part of a light frustum. The top region
// is a height field through the shadow texel centres that drops to the far
// plane along its rim; the skirt is a far-plane ring from that rim out to the
// clip-space edge. Together they cover the light footprint exactly once, with
// every triangle wound counter-clockwise when seen from beyond the far plane.
class VolumeCapMesh {
public:
    explicit VolumeCapMesh(int shadowSize);

    [[nodiscard]] int shadowSize() const { return m_shadowSize; }

    [[nodiscard]] std::uint32_t topVertexCount() const;
    [[nodiscard]] std::uint32_t skirtVertexCount() const;
    [[nodiscard]] std::uint32_t vertexCount() const;
    [[nodiscard]] std::uint32_t triangleCount() const { return vertexCount() / 3; }

    [[nodiscard]] CapRegion region(std::uint32_t vertexIndex) const;
    [[nodiscard]] CapVertex vertex(std::uint32_t vertexIndex) const;

    [[nodiscard]] glm::vec2 latticeToLightClip(const glm::ivec2& lattice) const;
    [[nodiscard]] glm::vec4 lightClipPosition(std::uint32_t vertexIndex, const ShadowMap& shadowMap) const;
    [[nodiscard]] glm::vec4 clipPosition(std::uint32_t vertexIndex, const ShadowMap& shadowMap, const glm::mat4& lightToScreen) const;

    // Depth of the cap surface above a light clip xy, interpolated over the
    // same triangles the mesh emits. Outside the rim this is the far plane.
    [[nodiscard]] float surfaceDepth(const ShadowMap& shadowMap, const glm::vec2& lightClipXY) const;

    // Whether a light clip point lies in the lit volume: inside the footprint,
    // behind the light and in front of the cap surface.
    [[nodiscard]] bool contains(const ShadowMap& shadowMap, const glm::vec3& lightClipPoint) const;

private:
    [[nodiscard]] CapVertex topVertex(std::uint32_t vertexIndex) const;
    [[nodiscard]] CapVertex skirtVertex(std::uint32_t skirtIndex) const;

    int m_shadowSize;
};

// Winding that faces out of the lit volume once the mesh has been transformed
// by lightToScreen into a reversed-Z clip space.
[[nodiscard]] bool capFrontFaceIsCounterClockwise(const glm::mat4& lightToScreen);
