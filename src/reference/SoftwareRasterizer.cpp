// SPDX-License-Identifier: MIT

#include "reference/SoftwareRasterizer.h"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <utility>
#include <vector>

namespace {

constexpr int kSubpixelBits = 8;
constexpr std::int64_t kSubpixelScale = std::int64_t { 1 } << kSubpixelBits;
constexpr std::int64_t kHalfPixel = kSubpixelScale / 2;
// Keeps snapped coordinates small enough for 64-bit edge functions.
constexpr float kGuardBand = 8.0f;

enum class ClipPlane {
    DepthNear,
    DepthFar,
    Right,
    Left,
    Top,
    Bottom,
};

constexpr std::array<ClipPlane, 6> kClipPlanes {
    ClipPlane::DepthNear, ClipPlane::DepthFar,
    ClipPlane::Right, ClipPlane::Left,
    ClipPlane::Top, ClipPlane::Bottom,
};

struct SnappedVertex {
    std::int64_t x { 0 };
    std::int64_t y { 0 };
    float depth { 0.0f };
};

[[nodiscard]] float planeDistance(const glm::vec4& v, ClipPlane plane)
{
    switch (plane) {
    case ClipPlane::DepthNear:
        return v.z;
    case ClipPlane::DepthFar:
        return v.w - v.z;
    case ClipPlane::Right:
        return kGuardBand * v.w - v.x;
    case ClipPlane::Left:
        return kGuardBand * v.w + v.x;
    case ClipPlane::Top:
        return kGuardBand * v.w - v.y;
    case ClipPlane::Bottom:
    default:
        return kGuardBand * v.w + v.y;
    }
}

[[nodiscard]] bool lexicographicLess(const glm::vec4& a, const glm::vec4& b)
{
    if (a.x != b.x)
        return a.x < b.x;
    if (a.y != b.y)
        return a.y < b.y;
    if (a.z != b.z)
        return a.z < b.z;
    return a.w < b.w;
}

// Interpolates from the lexicographically smaller endpoint so both triangles
// sharing an edge produce the same clipped vertex.
[[nodiscard]] glm::vec4 intersectEdge(const glm::vec4& a, const glm::vec4& b, ClipPlane plane)
{
    const bool swapped = lexicographicLess(b, a);
    const glm::vec4& from = swapped ? b : a;
    const glm::vec4& to = swapped ? a : b;
    const float dFrom = planeDistance(from, plane);
    const float dTo = planeDistance(to, plane);
    const float t = dFrom / (dFrom - dTo);
    return from + (to - from) * t;
}

[[nodiscard]] std::vector<glm::vec4> clipPolygon(const std::vector<glm::vec4>& input, ClipPlane plane)
{
    std::vector<glm::vec4> output;
    output.reserve(input.size() + 1);
    for (std::size_t i = 0; i < input.size(); ++i) {
        const glm::vec4& current = input[i];
        const glm::vec4& next = input[(i + 1) % input.size()];
        const bool currentInside = planeDistance(current, plane) >= 0.0f;
        const bool nextInside = planeDistance(next, plane) >= 0.0f;
        if (currentInside)
            output.push_back(current);
        if (currentInside != nextInside)
            output.push_back(intersectEdge(current, next, plane));
    }
    return output;
}

[[nodiscard]] std::int64_t edgeFunction(const SnappedVertex& a, const SnappedVertex& b, std::int64_t px, std::int64_t py)
{
    return (b.x - a.x) * (py - a.y) - (b.y - a.y) * (px - a.x);
}

// For counter-clockwise triangles with y up: left edges run downwards, top
// edges run in -x.
[[nodiscard]] bool isTopLeft(const SnappedVertex& a, const SnappedVertex& b)
{
    const std::int64_t dy = b.y - a.y;
    const std::int64_t dx = b.x - a.x;
    return dy < 0 || (dy == 0 && dx < 0);
}

[[nodiscard]] bool covers(std::int64_t edge, bool topLeft)
{
    return edge > 0 || (edge == 0 && topLeft);
}

} // namespace

SoftwareRasterizer::SoftwareRasterizer(int width, int height)
    : m_width(width)
    , m_height(height)
{
    if (width <= 0 || height <= 0)
        throw std::invalid_argument(fmt::format("Invalid raster size {}x{}", width, height));
}

void SoftwareRasterizer::drawTriangle(const std::array<glm::vec4, 3>& clipPositions, const FragmentCallback& onFragment) const
{
    std::vector<glm::vec4> polygon(clipPositions.begin(), clipPositions.end());
    for (ClipPlane plane : kClipPlanes) {
        polygon = clipPolygon(polygon, plane);
        if (polygon.size() < 3)
            return;
    }

    for (std::size_t i = 1; i + 1 < polygon.size(); ++i)
        rasterizeSnapped({ polygon[0], polygon[i], polygon[i + 1] }, onFragment);
}

void SoftwareRasterizer::rasterizeSnapped(const std::array<glm::vec4, 3>& clipPositions, const FragmentCallback& onFragment) const
{
    std::array<SnappedVertex, 3> v;
    for (std::size_t i = 0; i < 3; ++i) {
        const glm::vec4& clip = clipPositions[i];
        if (clip.w <= 0.0f)
            return;
        const float windowX = (clip.x / clip.w * 0.5f + 0.5f) * static_cast<float>(m_width);
        const float windowY = (clip.y / clip.w * 0.5f + 0.5f) * static_cast<float>(m_height);
        v[i].x = std::llround(static_cast<double>(windowX) * kSubpixelScale);
        v[i].y = std::llround(static_cast<double>(windowY) * kSubpixelScale);
        v[i].depth = clip.z / clip.w;
    }

    std::int64_t area = edgeFunction(v[0], v[1], v[2].x, v[2].y);
    if (area == 0)
        return;

    const bool counterClockwise = area > 0;
    const bool frontFacing = counterClockwise == m_frontFaceCCW;
    if (!counterClockwise) {
        std::swap(v[1], v[2]);
        area = -area;
    }

    const std::int64_t minX = std::min({ v[0].x, v[1].x, v[2].x });
    const std::int64_t maxX = std::max({ v[0].x, v[1].x, v[2].x });
    const std::int64_t minY = std::min({ v[0].y, v[1].y, v[2].y });
    const std::int64_t maxY = std::max({ v[0].y, v[1].y, v[2].y });

    const int x0 = static_cast<int>(std::max<std::int64_t>(0, (minX >> kSubpixelBits) - 1));
    const int x1 = static_cast<int>(std::min<std::int64_t>(m_width - 1, (maxX >> kSubpixelBits) + 1));
    const int y0 = static_cast<int>(std::max<std::int64_t>(0, (minY >> kSubpixelBits) - 1));
    const int y1 = static_cast<int>(std::min<std::int64_t>(m_height - 1, (maxY >> kSubpixelBits) + 1));

    const bool topLeft0 = isTopLeft(v[1], v[2]);
    const bool topLeft1 = isTopLeft(v[2], v[0]);
    const bool topLeft2 = isTopLeft(v[0], v[1]);
    const double inverseArea = 1.0 / static_cast<double>(area);

    RasterFragment fragment;
    fragment.frontFacing = frontFacing;
    for (int y = y0; y <= y1; ++y) {
        const std::int64_t py = static_cast<std::int64_t>(y) * kSubpixelScale + kHalfPixel;
        for (int x = x0; x <= x1; ++x) {
            const std::int64_t px = static_cast<std::int64_t>(x) * kSubpixelScale + kHalfPixel;
            const std::int64_t w0 = edgeFunction(v[1], v[2], px, py);
            const std::int64_t w1 = edgeFunction(v[2], v[0], px, py);
            const std::int64_t w2 = edgeFunction(v[0], v[1], px, py);
            if (!covers(w0, topLeft0) || !covers(w1, topLeft1) || !covers(w2, topLeft2))
                continue;

            const double depth = (static_cast<double>(w0) * v[0].depth
                                     + static_cast<double>(w1) * v[1].depth
                                     + static_cast<double>(w2) * v[2].depth)
                * inverseArea;

            fragment.x = x;
            fragment.y = y;
            fragment.depth = static_cast<float>(depth);
            onFragment(fragment);
        }
    }
}
