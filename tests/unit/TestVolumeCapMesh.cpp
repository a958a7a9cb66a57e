// SPDX-License-Identifier: MIT

#include "reference/ImageBuffer.h"
#include "reference/SoftwareRasterizer.h"
#include "volumetric/ShadowMap.h"
#include "volumetric/VolumeCapMesh.h"

#include <gtest/gtest.h>

#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <glm/mat4x4.hpp>
DISABLE_WARNINGS_POP()

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <set>
#include <stdexcept>
#include <utility>

namespace {

// Uneven height field so neighbouring texels differ.
ShadowMap makePatternShadowMap(int size)
{
    ShadowMap shadowMap(size, LightFrustum {});
    for (int y = 0; y < size; ++y) {
        for (int x = 0; x < size; ++x)
            shadowMap.setDepth(x, y, 0.2f + 0.7f * static_cast<float>((x * 7 + y * 13) % 10) / 9.0f);
    }
    return shadowMap;
}

} // namespace

TEST(VolumeCapMesh, VertexCountsFollowShadowSize)
{
    const VolumeCapMesh mesh(4);
    EXPECT_EQ(mesh.topVertexCount(), 6u * 5u * 5u);
    EXPECT_EQ(mesh.skirtVertexCount(), 24u * 4u);
    EXPECT_EQ(mesh.vertexCount(), 150u + 96u);
    EXPECT_EQ(mesh.triangleCount(), 82u);

    const VolumeCapMesh large(1024);
    EXPECT_EQ(large.vertexCount(), 6u * 1025u * 1025u + 24u * 1024u);
}

TEST(VolumeCapMesh, RejectsTinyShadowMaps)
{
    EXPECT_THROW(VolumeCapMesh(1), std::invalid_argument);
    EXPECT_THROW(VolumeCapMesh(0), std::invalid_argument);
    EXPECT_NO_THROW(VolumeCapMesh(2));
}

TEST(VolumeCapMesh, RejectsShadowMapsBeyondTheDrawableSize)
{
    EXPECT_THROW(VolumeCapMesh(kMaxShadowSize + 1), std::invalid_argument);
    EXPECT_THROW(VolumeCapMesh(20000), std::invalid_argument);
    EXPECT_THROW(ShadowMap(kMaxShadowSize + 1, LightFrustum {}), std::invalid_argument);
}

TEST(VolumeCapMesh, LargestMeshStillFitsADrawCount)
{
    const VolumeCapMesh mesh(kMaxShadowSize);
    EXPECT_EQ(mesh.topVertexCount(), 1610809350u);
    EXPECT_EQ(mesh.vertexCount(), 1611202566u);
    EXPECT_LE(mesh.vertexCount(), static_cast<std::uint32_t>(std::numeric_limits<std::int32_t>::max()));
    EXPECT_EQ(mesh.region(mesh.vertexCount() - 1), CapRegion::Skirt);
}

TEST(VolumeCapMesh, ClassifiesRegions)
{
    const VolumeCapMesh mesh(4);
    EXPECT_EQ(mesh.region(0), CapRegion::Top);
    EXPECT_EQ(mesh.region(mesh.topVertexCount() - 1), CapRegion::Top);
    EXPECT_EQ(mesh.region(mesh.topVertexCount()), CapRegion::Skirt);
    EXPECT_EQ(mesh.region(mesh.vertexCount() - 1), CapRegion::Skirt);
    EXPECT_THROW((void)mesh.vertex(mesh.vertexCount()), std::out_of_range);
}

TEST(VolumeCapMesh, OuterRingOfTopRegionFallsToFarPlane)
{
    const VolumeCapMesh mesh(4);

    // First cell sits one texel outside the map; only its (1, 1) corner is a texel.
    const CapVertex outside = mesh.vertex(0);
    EXPECT_EQ(outside.lattice, glm::ivec2(1, 1));
    EXPECT_FALSE(outside.texel.has_value());

    const CapVertex inside = mesh.vertex(2);
    EXPECT_EQ(inside.lattice, glm::ivec2(1, 1));
    ASSERT_TRUE(inside.texel.has_value());
    EXPECT_EQ(*inside.texel, glm::ivec2(0, 0));

    const ShadowMap shadowMap = makePatternShadowMap(4);
    EXPECT_FLOAT_EQ(mesh.lightClipPosition(0, shadowMap).z, kFarPlaneDepth);
    EXPECT_FLOAT_EQ(mesh.lightClipPosition(2, shadowMap).z, shadowMap.depth(0, 0));
}

TEST(VolumeCapMesh, TexelVerticesSitOnTexelCentres)
{
    const VolumeCapMesh mesh(4);
    const ShadowMap shadowMap = makePatternShadowMap(4);

    for (std::uint32_t i = 0; i < mesh.topVertexCount(); ++i) {
        const CapVertex vertex = mesh.vertex(i);
        if (!vertex.texel)
            continue;
        EXPECT_EQ(vertex.lattice, *vertex.texel * 2 + 1);
        const glm::vec4 position = mesh.lightClipPosition(i, shadowMap);
        EXPECT_FLOAT_EQ(position.z, shadowMap.depth(vertex.texel->x, vertex.texel->y));
        EXPECT_FLOAT_EQ(position.w, 1.0f);
    }
}

TEST(VolumeCapMesh, SkirtStaysOnFarPlaneBetweenRimAndClipEdge)
{
    const VolumeCapMesh mesh(4);
    const ShadowMap shadowMap = makePatternShadowMap(4);

    std::set<std::pair<int, int>> outerCorners;
    for (std::uint32_t i = mesh.topVertexCount(); i < mesh.vertexCount(); ++i) {
        const CapVertex vertex = mesh.vertex(i);
        EXPECT_FALSE(vertex.texel.has_value());
        EXPECT_FLOAT_EQ(mesh.lightClipPosition(i, shadowMap).z, kFarPlaneDepth);

        const glm::ivec2 l = vertex.lattice;
        const bool onRing = l.x <= 1 || l.y <= 1 || l.x >= 7 || l.y >= 7;
        EXPECT_TRUE(onRing) << "lattice " << l.x << "," << l.y;
        if ((l.x == 0 || l.x == 8) && (l.y == 0 || l.y == 8))
            outerCorners.insert({ l.x, l.y });
    }
    EXPECT_EQ(outerCorners.size(), 4u);
}

// Rim vertices of the top region and inner vertices of the skirt are produced
// from the same lattice points, so they coincide exactly.
TEST(VolumeCapMesh, SkirtStitchesToTopRim)
{
    for (int shadowSize : { 2, 5, 16 }) {
        const VolumeCapMesh mesh(shadowSize);
        const ShadowMap shadowMap = makePatternShadowMap(shadowSize);
        const int edge = 2 * shadowSize;

        std::set<std::array<float, 4>> top;
        std::set<std::array<float, 4>> skirt;
        const auto key = [&](std::uint32_t index) {
            const glm::vec4 p = mesh.lightClipPosition(index, shadowMap);
            return std::array<float, 4> { p.x, p.y, p.z, p.w };
        };
        for (std::uint32_t i = 0; i < mesh.topVertexCount(); ++i) {
            if (!mesh.vertex(i).texel)
                top.insert(key(i));
        }
        for (std::uint32_t i = mesh.topVertexCount(); i < mesh.vertexCount(); ++i) {
            const glm::ivec2 l = mesh.vertex(i).lattice;
            if (l.x > 0 && l.y > 0 && l.x < edge && l.y < edge)
                skirt.insert(key(i));
        }

        EXPECT_EQ(top, skirt) << "shadow size " << shadowSize;
        EXPECT_EQ(top.size(), static_cast<std::size_t>(4 * shadowSize - 4));
    }
}

TEST(VolumeCapMesh, LatticeMapsToLightClip)
{
    const VolumeCapMesh mesh(8);
    EXPECT_EQ(mesh.latticeToLightClip(glm::ivec2(0, 0)), glm::vec2(-1.0f, -1.0f));
    EXPECT_EQ(mesh.latticeToLightClip(glm::ivec2(16, 16)), glm::vec2(1.0f, 1.0f));
    EXPECT_EQ(mesh.latticeToLightClip(glm::ivec2(8, 0)), glm::vec2(0.0f, -1.0f));
    EXPECT_FLOAT_EQ(mesh.latticeToLightClip(glm::ivec2(1, 3)).x, 1.0f / 8.0f - 1.0f);
    EXPECT_FLOAT_EQ(mesh.latticeToLightClip(glm::ivec2(1, 3)).y, 3.0f / 8.0f - 1.0f);
}

// Seen along the light, top region and skirt tile the footprint exactly once
// with every triangle facing away from the light, and the rasterized depth is
// the surface that surfaceDepth() describes.
TEST(VolumeCapMesh, CoversFootprintExactlyOnce)
{
    constexpr int shadowSize = 8;
    constexpr int raster = 2 * shadowSize;
    const VolumeCapMesh mesh(shadowSize);
    const ShadowMap shadowMap = makePatternShadowMap(shadowSize);
    const SoftwareRasterizer rasterizer(raster, raster);

    ImageBuffer<int> coverage(raster, raster, 0);
    int backFacing = 0;
    float worstDepthError = 0.0f;
    for (std::uint32_t first = 0; first < mesh.vertexCount(); first += 3) {
        const std::array<glm::vec4, 3> clip {
            mesh.lightClipPosition(first, shadowMap),
            mesh.lightClipPosition(first + 1, shadowMap),
            mesh.lightClipPosition(first + 2, shadowMap),
        };
        rasterizer.drawTriangle(clip, [&](const RasterFragment& fragment) {
            coverage.at(fragment.x, fragment.y) += 1;
            if (!fragment.frontFacing)
                ++backFacing;

            const glm::vec2 lightXY(
                (static_cast<float>(fragment.x) + 0.5f) / raster * 2.0f - 1.0f,
                (static_cast<float>(fragment.y) + 0.5f) / raster * 2.0f - 1.0f);
            const float expected = mesh.surfaceDepth(shadowMap, lightXY);
            worstDepthError = std::max(worstDepthError, std::abs(fragment.depth - expected));
        });
    }

    for (int y = 0; y < raster; ++y) {
        for (int x = 0; x < raster; ++x)
            EXPECT_EQ(coverage.at(x, y), 1) << "pixel " << x << "," << y;
    }
    EXPECT_EQ(backFacing, 0);
    EXPECT_LT(worstDepthError, 5e-3f);
}

TEST(VolumeCapMesh, SurfaceDepthMatchesTexelsAndFallsOffOutsideRim)
{
    const VolumeCapMesh mesh(8);
    const ShadowMap shadowMap = makePatternShadowMap(8);

    for (int y = 0; y < 8; ++y) {
        for (int x = 0; x < 8; ++x) {
            const glm::vec2 centre = mesh.latticeToLightClip(glm::ivec2(2 * x + 1, 2 * y + 1));
            EXPECT_NEAR(mesh.surfaceDepth(shadowMap, centre), shadowMap.depth(x, y), 1e-5f);
        }
    }

    EXPECT_FLOAT_EQ(mesh.surfaceDepth(shadowMap, glm::vec2(-0.99f, 0.0f)), kFarPlaneDepth);
    EXPECT_FLOAT_EQ(mesh.surfaceDepth(shadowMap, glm::vec2(0.0f, 0.99f)), kFarPlaneDepth);

    // Midway between two texel centres on a row the surface is their average.
    const glm::vec2 between = mesh.latticeToLightClip(glm::ivec2(4, 5));
    EXPECT_NEAR(mesh.surfaceDepth(shadowMap, between), 0.5f * (shadowMap.depth(1, 2) + shadowMap.depth(2, 2)), 1e-5f);
}

TEST(VolumeCapMesh, ContainsOnlyPointsBetweenLightAndSurface)
{
    const VolumeCapMesh mesh(8);
    ShadowMap shadowMap(8, LightFrustum {});
    shadowMap.fill(0.6f);

    EXPECT_TRUE(mesh.contains(shadowMap, glm::vec3(0.0f, 0.0f, 0.3f)));
    EXPECT_FALSE(mesh.contains(shadowMap, glm::vec3(0.0f, 0.0f, 0.7f)));
    EXPECT_FALSE(mesh.contains(shadowMap, glm::vec3(0.0f, 0.0f, -0.1f)));
    EXPECT_FALSE(mesh.contains(shadowMap, glm::vec3(1.2f, 0.0f, 0.3f)));
    // Between the rim and the clip edge the volume reaches the far plane.
    EXPECT_TRUE(mesh.contains(shadowMap, glm::vec3(0.97f, 0.0f, 0.9f)));
}

TEST(VolumeCapMesh, FrontFaceFollowsDeterminant)
{
    EXPECT_TRUE(capFrontFaceIsCounterClockwise(glm::mat4(1.0f)));

    glm::mat4 mirrored(1.0f);
    mirrored[0][0] = -1.0f;
    EXPECT_FALSE(capFrontFaceIsCounterClockwise(mirrored));
}
