// SPDX-License-Identifier: MIT

#include "reference/ImageBuffer.h"
#include "reference/SoftwareRasterizer.h"

#include <gtest/gtest.h>

#include <array>
#include <stdexcept>
#include <vector>

namespace {

ImageBuffer<int> coverageOf(const SoftwareRasterizer& rasterizer, const std::vector<std::array<glm::vec4, 3>>& triangles)
{
    ImageBuffer<int> coverage(rasterizer.width(), rasterizer.height(), 0);
    for (const auto& triangle : triangles) {
        rasterizer.drawTriangle(triangle, [&](const RasterFragment& fragment) {
            coverage.at(fragment.x, fragment.y) += 1;
        });
    }
    return coverage;
}

} // namespace

TEST(SoftwareRasterizer, RejectsEmptyTargets)
{
    EXPECT_THROW(SoftwareRasterizer(0, 4), std::invalid_argument);
    EXPECT_THROW(SoftwareRasterizer(4, -1), std::invalid_argument);
}

TEST(SoftwareRasterizer, QuadSplitAlongDiagonalCoversEachPixelOnce)
{
    const SoftwareRasterizer rasterizer(16, 16);
    const glm::vec4 a(-1.0f, -1.0f, 0.5f, 1.0f);
    const glm::vec4 b(1.0f, -1.0f, 0.5f, 1.0f);
    const glm::vec4 c(1.0f, 1.0f, 0.5f, 1.0f);
    const glm::vec4 d(-1.0f, 1.0f, 0.5f, 1.0f);

    const ImageBuffer<int> coverage = coverageOf(rasterizer, { { a, b, c }, { a, c, d } });
    for (int count : coverage.pixels())
        EXPECT_EQ(count, 1);
}

// A fan of thin triangles around an interior point: shared edges pass through
// pixel centres at all sorts of slopes.
TEST(SoftwareRasterizer, FanIsWatertight)
{
    const SoftwareRasterizer rasterizer(23, 17);
    const glm::vec4 centre(0.13f, -0.07f, 0.5f, 1.0f);
    const std::array<glm::vec4, 8> rim { {
        { -1.0f, -1.0f, 0.5f, 1.0f },
        { 0.0f, -1.0f, 0.5f, 1.0f },
        { 1.0f, -1.0f, 0.5f, 1.0f },
        { 1.0f, 0.0f, 0.5f, 1.0f },
        { 1.0f, 1.0f, 0.5f, 1.0f },
        { 0.0f, 1.0f, 0.5f, 1.0f },
        { -1.0f, 1.0f, 0.5f, 1.0f },
        { -1.0f, 0.0f, 0.5f, 1.0f },
    } };

    std::vector<std::array<glm::vec4, 3>> triangles;
    for (std::size_t i = 0; i < rim.size(); ++i)
        triangles.push_back({ centre, rim[i], rim[(i + 1) % rim.size()] });

    const ImageBuffer<int> coverage = coverageOf(rasterizer, triangles);
    for (int y = 0; y < coverage.height(); ++y) {
        for (int x = 0; x < coverage.width(); ++x)
            EXPECT_EQ(coverage.at(x, y), 1) << "pixel " << x << "," << y;
    }
}

TEST(SoftwareRasterizer, ReportsFacing)
{
    SoftwareRasterizer rasterizer(8, 8);
    const std::array<glm::vec4, 3> counterClockwise { {
        { -1.0f, -1.0f, 0.5f, 1.0f },
        { 1.0f, -1.0f, 0.5f, 1.0f },
        { -1.0f, 1.0f, 0.5f, 1.0f },
    } };
    const std::array<glm::vec4, 3> clockwise { { counterClockwise[0], counterClockwise[2], counterClockwise[1] } };

    int front = 0;
    int back = 0;
    const auto count = [&](const RasterFragment& fragment) { fragment.frontFacing ? ++front : ++back; };

    rasterizer.drawTriangle(counterClockwise, count);
    rasterizer.drawTriangle(clockwise, count);
    EXPECT_GT(front, 0);
    EXPECT_EQ(front, back);

    front = 0;
    back = 0;
    rasterizer.setFrontFaceCounterClockwise(false);
    rasterizer.drawTriangle(counterClockwise, count);
    EXPECT_EQ(front, 0);
    EXPECT_GT(back, 0);
}

TEST(SoftwareRasterizer, InterpolatesWindowDepth)
{
    const SoftwareRasterizer rasterizer(32, 32);
    // Depth 0.2 along the left edge rising to 0.8 on the right.
    const std::array<glm::vec4, 3> triangle { {
        { -1.0f, -1.0f, 0.2f, 1.0f },
        { 1.0f, -1.0f, 0.8f, 1.0f },
        { 1.0f, 1.0f, 0.8f, 1.0f },
    } };

    rasterizer.drawTriangle(triangle, [](const RasterFragment& fragment) {
        const float expected = 0.2f + 0.6f * (static_cast<float>(fragment.x) + 0.5f) / 32.0f;
        EXPECT_NEAR(fragment.depth, expected, 1e-3f);
    });
}

TEST(SoftwareRasterizer, DividesByW)
{
    const SoftwareRasterizer rasterizer(8, 8);
    // The same full-screen quad as before, scaled by w = 4.
    const glm::vec4 a(-4.0f, -4.0f, 2.0f, 4.0f);
    const glm::vec4 b(4.0f, -4.0f, 2.0f, 4.0f);
    const glm::vec4 c(4.0f, 4.0f, 2.0f, 4.0f);
    const glm::vec4 d(-4.0f, 4.0f, 2.0f, 4.0f);

    int fragments = 0;
    for (const auto& triangle : { std::array<glm::vec4, 3> { a, b, c }, std::array<glm::vec4, 3> { a, c, d } }) {
        rasterizer.drawTriangle(triangle, [&](const RasterFragment& fragment) {
            ++fragments;
            EXPECT_NEAR(fragment.depth, 0.5f, 1e-6f);
        });
    }
    EXPECT_EQ(fragments, 64);
}

TEST(SoftwareRasterizer, ClipsAgainstDepthRange)
{
    const SoftwareRasterizer rasterizer(8, 8);

    int fragments = 0;
    const auto count = [&](const RasterFragment& fragment) {
        ++fragments;
        EXPECT_GE(fragment.depth, 0.0f);
        EXPECT_LE(fragment.depth, 1.0f);
    };

    // Entirely in front of the near plane of a zero-to-one range.
    rasterizer.drawTriangle({ { { -1.0f, -1.0f, 1.5f, 1.0f }, { 1.0f, -1.0f, 1.5f, 1.0f }, { -1.0f, 1.0f, 1.5f, 1.0f } } }, count);
    // Entirely behind the viewer.
    rasterizer.drawTriangle({ { { -1.0f, -1.0f, 0.5f, -1.0f }, { 1.0f, -1.0f, 0.5f, -1.0f }, { -1.0f, 1.0f, 0.5f, -1.0f } } }, count);
    EXPECT_EQ(fragments, 0);

    // Left half of the screen in range, right half past z = w.
    rasterizer.drawTriangle({ { { -1.0f, -1.0f, 0.0f, 1.0f }, { 1.0f, -1.0f, 2.0f, 1.0f }, { 1.0f, 1.0f, 2.0f, 1.0f } } }, count);
    rasterizer.drawTriangle({ { { -1.0f, -1.0f, 0.0f, 1.0f }, { 1.0f, 1.0f, 2.0f, 1.0f }, { -1.0f, 1.0f, 0.0f, 1.0f } } }, count);
    EXPECT_EQ(fragments, 32);
}

TEST(SoftwareRasterizer, HugeTrianglesStillCoverTheScreen)
{
    const SoftwareRasterizer rasterizer(8, 8);
    const ImageBuffer<int> coverage = coverageOf(rasterizer,
        { { { { -1000.0f, -1000.0f, 0.5f, 1.0f }, { 3000.0f, -1000.0f, 0.5f, 1.0f }, { -1000.0f, 3000.0f, 0.5f, 1.0f } } } });
    for (int count : coverage.pixels())
        EXPECT_EQ(count, 1);
}
