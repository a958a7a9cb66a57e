// SPDX-License-Identifier: MIT
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

enum class RenderPass : std::size_t {
    ShadowMap = 0,
    Geometry,
    FarCap,
    NearCap,
    Composition,
    Count
};

[[nodiscard]] constexpr const char* renderPassName(RenderPass pass)
{
    switch (pass) {
    case RenderPass::ShadowMap:
        return "shadow map";
    case RenderPass::Geometry:
        return "geometry";
    case RenderPass::FarCap:
        return "far cap";
    case RenderPass::NearCap:
        return "near cap";
    case RenderPass::Composition:
        return "composition";
    case RenderPass::Count:
        break;
    }
    return "?";
}

// Draw calls and triangles of one frame, split by pass for the overlay.
struct RenderStats {
    static constexpr std::size_t kPassCount = static_cast<std::size_t>(RenderPass::Count);

    std::array<std::uint64_t, kPassCount> drawCalls {};
    std::array<std::uint64_t, kPassCount> triangles {};

    void reset()
    {
        drawCalls.fill(0);
        triangles.fill(0);
    }

    void addDraw(RenderPass pass, std::uint64_t triangleCount)
    {
        drawCalls[static_cast<std::size_t>(pass)] += 1;
        triangles[static_cast<std::size_t>(pass)] += triangleCount;
    }

    [[nodiscard]] std::uint64_t totalDrawCalls() const
    {
        std::uint64_t total = 0;
        for (std::uint64_t count : drawCalls)
            total += count;
        return total;
    }

    [[nodiscard]] std::uint64_t totalTriangles() const
    {
        std::uint64_t total = 0;
        for (std::uint64_t count : triangles)
            total += count;
        return total;
    }
};
